#pragma once

#include <archive_mcp/archive/archive_directory.hpp>
#include <archive_mcp/index/document_index.hpp>
#include <archive_mcp/mcp/context_aggregator.hpp>
#include <archive_mcp/mcp/resource_registry.hpp>
#include <archive_mcp/mcp/tool_registry.hpp>

#include <string>

namespace archive_mcp {

constexpr const char* kIndexResourceUri = "archive://index";
constexpr const char* kDocumentResourcePrefix = "archive://documents/";

// Register list_documents, get_document, search_documents and
// summarize_document. Handlers capture `archive` and `index` by reference;
// both must outlive the registry.
void RegisterArchiveTools(ToolRegistry& registry,
                          const ArchiveDirectory& archive,
                          DocumentIndex& index,
                          int default_top_k = 5);

// archive://index plus one archive://documents/<filename> per document
// present at registration time.
void RegisterArchiveResources(ResourceRegistry& registry,
                              const ArchiveDirectory& archive);

void RegisterArchiveContext(ContextAggregator& context,
                            const ArchiveDirectory& archive,
                            const DocumentIndex& index,
                            const std::string& archive_title);

} // namespace archive_mcp
