#ifndef DOCSTORE_STORE_CORE_ENGINE_HPP
#define DOCSTORE_STORE_CORE_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "value.hpp"

namespace docstore::store {

/**
 * @brief Storage engines, in selection priority order.
 */
enum class EngineKind : uint8_t { Relational, Document, Memory };

[[nodiscard]] inline std::string_view engineKindToString(
    EngineKind kind) noexcept {
    switch (kind) {
        case EngineKind::Relational:
            return "relational";
        case EngineKind::Document:
            return "document";
        case EngineKind::Memory:
            return "memory";
    }
    return "unknown";
}

/**
 * @brief Contract shared by every storage engine.
 *
 * Engines perform no argument validation beyond what their backend
 * requires; StoreFacade validates caller input before delegating. Fields
 * passed to createDocument may carry the reserved `_id`, `created_at` and
 * `updated_at` entries; fields passed to updateDocument never do.
 *
 * Operation failures are reported as BackendOperationError, bad input the
 * backend cannot represent as ValidationError.
 */
class StorageEngine {
public:
    virtual ~StorageEngine() = default;

    [[nodiscard]] virtual EngineKind kind() const noexcept = 0;

    /// Collection names, sorted.
    virtual std::vector<std::string> listCollections() = 0;

    /// Insert a document, creating the collection on first use.
    /// @return The supplied or generated id.
    virtual std::string createDocument(const std::string& collection,
                                       const Fields& fields) = 0;

    virtual std::optional<Document> getDocument(const std::string& collection,
                                                const std::string& id) = 0;

    /// Merge @p fields into the document and refresh updated_at.
    /// @return 1 if the document exists, otherwise 0.
    virtual std::size_t updateDocument(const std::string& collection,
                                       const std::string& id,
                                       const Fields& fields) = 0;

    /// @return Number of documents removed (0 or 1).
    virtual std::size_t deleteDocument(const std::string& collection,
                                       const std::string& id) = 0;

    virtual std::vector<Document> listDocuments(const std::string& collection,
                                                const ListOptions& options) = 0;

    virtual std::size_t countDocuments(const std::string& collection,
                                       const QuerySpec& query) = 0;

    /// Release backend resources. Further calls are undefined.
    virtual void close() = 0;
};

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_CORE_ENGINE_HPP
