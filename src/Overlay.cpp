/**
 * @file Overlay.cpp
 * @brief Implementation of the top-level load and merge entry points
 */

#include "overlay/Overlay.hpp"
#include "overlay/Loader.hpp"
#include "overlay/Resolver.hpp"

namespace overlay {

MergeResult merge_documents(const std::vector<Document>& documents,
                            const MergeOptions& options) {
    MergeEngine engine(options);
    for (const auto& doc : documents) {
        engine.fold(resolve_directives(doc));
    }
    return engine.finish();
}

MergeResult load_and_merge(const LoadOptions& opts) {
    // Every file is decoded before anything is merged
    std::vector<Document> documents;
    documents.reserve(opts.files.size());
    for (const auto& file : opts.files) {
        documents.push_back(load_document(file));
    }
    return merge_documents(documents, opts.merge);
}

} // namespace overlay
