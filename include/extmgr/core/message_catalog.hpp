#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "extmgr/utils/result.hpp"

namespace extmgr {
namespace core {

/**
 * @brief Translates message keys into human-readable text.
 *
 * Templates use printf-like placeholders: "%s" takes the next parameter,
 * "%2$s" takes the second one, "%%" is a literal percent sign. A key with no
 * entry translates to the key itself followed by its parameters.
 */
class MessageCatalog {
public:
    MessageCatalog() = default;

    /**
     * @brief Catalog with English texts for every key the library emits.
     */
    static MessageCatalog defaults();

    void set(const std::string& key, const std::string& text);
    bool contains(const std::string& key) const;

    std::string translate(const std::string& key,
                          const std::vector<std::string>& parameters = {}) const;

    /**
     * @brief Adds or overrides entries from a {"KEY": "text"} object.
     */
    Result<void> merge(const nlohmann::json& entries);

    /**
     * @brief Reads a JSON catalog file and merges it into this catalog.
     */
    Result<void> merge_file(const std::string& path);

    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, std::string> entries_;
};

} // namespace core
} // namespace extmgr
