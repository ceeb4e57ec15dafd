#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "overlay/Errors.hpp"
#include "overlay/Overlay.hpp"
#include "overlay/Path.hpp"

using namespace overlay;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("overlay-cli", "Merge layered YAML/JSON/TOML documents (later files win)");
        options.positional_help("FILE [FILE...]");

        options.add_options()
            ("i,indent", "JSON indentation of the output", cxxopts::value<int>()->default_value("2"))
            ("append-sequences", "Append sequence elements across files instead of replacing")
            ("keep-resets", "Do not apply !reset deletions; list them on stderr instead")
            ("g,get", "Print only the value at PATH (e.g. services.web.ports[0])", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("files", "Input files", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"files"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("files")) {
            std::cout << options.help() << "\n";
            return result.count("help") ? 0 : 1;
        }

        LoadOptions load;
        load.files = result["files"].as<std::vector<std::string>>();
        if (result.count("append-sequences")) {
            load.merge.sequences = SequencePolicy::AppendUnique;
        }
        if (result.count("keep-resets")) {
            load.merge.apply_resets = false;
        }
        const int indent = result["indent"].as<int>();

        MergeResult merged = load_and_merge(load);

        if (!load.merge.apply_resets) {
            for (const auto& p : render_all(merged.resets)) {
                std::cerr << "reset: " << p << "\n";
            }
        }

        if (result.count("get")) {
            const std::string text = result["get"].as<std::string>();
            const Value* v = find_at(merged.tree, Path::parse(text));
            if (!v) {
                std::cerr << "Path not found: " << text << "\n";
                return 1;
            }
            std::cout << v->dump(indent) << "\n";
            return 0;
        }

        std::cout << merged.tree.dump(indent) << "\n";
        return 0;

    } catch (const CycleError& ce) {
        std::cerr << "Error: " << ce.what();
        if (!ce.document().empty()) std::cerr << " (in " << ce.document() << ")";
        std::cerr << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
