#pragma once
/**
 * @file tv_config.hpp
 * @brief Persistent TV registry for the command line tool.
 *
 * The file is a JSON object keyed by TV name; `"_default"` holds the name of the TV
 * used when none is given:
 * @code
 * {
 *     "_default": "living",
 *     "living": {"name": "living", "ip": "192.168.1.20", "mac": "a8:23:fe:00:11:22",
 *                "key": "0c7a...", "hostname": null}
 * }
 * @endcode
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/result.hpp"

namespace lgtv::cli
{

enum class ConfigErrc
{
    NoLocation,  ///< No search path is usable.
    Unreadable,  ///< The file exists but cannot be read.
    Malformed,   ///< The file is not a JSON object.
    WriteFailed, ///< Atomic write failed.
    UnknownTv,   ///< No entry with that name.
    NoDefault    ///< No name given and no "_default" set.
};

const char *to_string(ConfigErrc err) noexcept;

template <typename T> using ConfigResult = utils::Result<T, ConfigErrc>;
using ConfigStatus = utils::Status<ConfigErrc>;

struct TvEntry
{
    std::string name;
    std::string ip;
    std::optional<std::string> mac;
    std::optional<std::string> key;
    std::optional<std::string> hostname;

    nlohmann::json to_json() const;
    static TvEntry from_json(const std::string &name, const nlohmann::json &j);
};

class TvConfigStore
{
  public:
    static constexpr const char *kDefaultKey = "_default";

    /// @brief `$LGTV_CONFIG` if set, then the system, XDG, legacy and venv locations.
    static std::vector<std::filesystem::path> search_paths();

    /**
     * @brief First existing writable file in `search_paths()`, otherwise the first path
     *        whose directory exists and is writable or can be created.
     */
    static ConfigResult<std::filesystem::path> locate();

    explicit TvConfigStore(std::filesystem::path path);

    /// @brief A missing file loads as an empty registry.
    ConfigStatus load();

    /// @brief Writes to a temporary file in the same directory and renames it over the target.
    ConfigStatus save() const;

    std::optional<TvEntry> get_tv(const std::string &name) const;
    void put_tv(const TvEntry &entry);
    std::optional<std::string> default_tv() const;
    ConfigStatus set_default(const std::string &name);

    /// @brief The named TV, or the default one when `name` is empty.
    ConfigResult<TvEntry> resolve(const std::optional<std::string> &name) const;

    std::vector<std::string> names() const;
    const std::filesystem::path &path() const noexcept { return m_path; }
    const nlohmann::json &document() const noexcept { return m_doc; }

  private:
    std::filesystem::path m_path;
    nlohmann::json m_doc = nlohmann::json::object();
};

} // namespace lgtv::cli
