#ifndef EDI_X12_CONFIG_TRANSACTION_CATALOG_H
#define EDI_X12_CONFIG_TRANSACTION_CATALOG_H

/**
 * @file transaction_catalog.h
 * @brief Read-only mapping from X12 transaction set codes to names
 *
 * The catalog is built once and then only read, so a single instance can
 * be shared by any number of parsers and threads without locking.
 *
 * CSV format (one entry per line, no header):
 * @code
 * # code,name
 * 850,Purchase Order
 * 856,"Ship Notice/Manifest"
 * @endcode
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace edi::x12::config {

/**
 * @brief Catalog loading error codes
 */
enum class catalog_error {
    /** Catalog file does not exist */
    file_not_found,

    /** Catalog file could not be read */
    io_error,

    /** A line is not a valid code,name pair */
    invalid_format
};

/**
 * @brief Get human-readable description of catalog error
 */
[[nodiscard]] constexpr const char* to_string(catalog_error error) noexcept {
    switch (error) {
        case catalog_error::file_not_found:
            return "Catalog file not found";
        case catalog_error::io_error:
            return "Failed to read catalog file";
        case catalog_error::invalid_format:
            return "Invalid catalog entry";
        default:
            return "Unknown catalog error";
    }
}

/**
 * @brief Detailed catalog loading error
 */
struct catalog_load_error {
    catalog_error code = catalog_error::invalid_format;
    std::string message;
    std::optional<std::filesystem::path> file_path;
    std::optional<std::size_t> line_number;
};

/**
 * @brief Transaction set code to name lookup
 *
 * @example
 * ```cpp
 * auto catalog = transaction_catalog::standard();
 * catalog.lookup("850");  // "Purchase Order"
 * catalog.lookup("XYZ");  // "unidentified"
 * ```
 */
class transaction_catalog {
public:
    /** Name returned for codes missing from the catalog */
    static constexpr std::string_view unidentified = "unidentified";

    /**
     * @brief Empty catalog; every lookup is unidentified
     */
    transaction_catalog() = default;

    /**
     * @brief Catalog over an explicit code to name map
     */
    explicit transaction_catalog(std::map<std::string, std::string, std::less<>> names);

    /**
     * @brief Catalog of the published X12 transaction sets
     */
    [[nodiscard]] static transaction_catalog standard();

    /**
     * @brief Parse a catalog from CSV text
     *
     * Blank lines and lines starting with '#' are ignored. Names may be
     * enclosed in double quotes, with "" standing for a literal quote.
     */
    [[nodiscard]] static std::expected<transaction_catalog, catalog_load_error>
    from_csv(std::string_view csv);

    /**
     * @brief Load a catalog from a CSV file
     */
    [[nodiscard]] static std::expected<transaction_catalog, catalog_load_error>
    load_csv(const std::filesystem::path& path);

    /**
     * @brief Resolve a transaction set code
     * @param code Transaction set identifier (ST01)
     * @return Name, or "unidentified" for unknown codes
     */
    [[nodiscard]] std::string lookup(std::string_view code) const;

    /**
     * @brief Check whether a code has an entry
     */
    [[nodiscard]] bool contains(std::string_view code) const;

    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

    [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

private:
    std::map<std::string, std::string, std::less<>> names_;
};

}  // namespace edi::x12::config

#endif  // EDI_X12_CONFIG_TRANSACTION_CATALOG_H
