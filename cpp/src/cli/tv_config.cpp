// src/cli/tv_config.cpp
#include "lgtv_service.hpp"
#include "cli/tv_config.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <fmt/ranges.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace lgtv::cli
{

namespace
{

std::optional<fs::path> env_path(const char *name)
{
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return fs::path(value);
}

bool is_writable(const fs::path &p)
{
    return ::access(p.c_str(), W_OK) == 0;
}

std::optional<std::string> optional_string(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

nlohmann::json nullable(const std::optional<std::string> &value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

/// mkstemp in the target's directory, write, fsync, rename. Leaves no temp file on failure.
ConfigStatus atomic_write(const fs::path &target, const std::string &contents)
{
    fs::path parent = target.parent_path();
    if (parent.empty())
    {
        parent = ".";
    }
    std::error_code create_ec;
    fs::create_directories(parent, create_ec);
    if (create_ec)
    {
        LOGGER_ERROR("TvConfigStore: cannot create {}: {}", parent.string(), create_ec.message());
        return ConfigStatus::error(ConfigErrc::WriteFailed, create_ec.value(), create_ec.message());
    }

    struct stat lstat_buf;
    if (::lstat(target.c_str(), &lstat_buf) == 0 && S_ISLNK(lstat_buf.st_mode))
    {
        LOGGER_ERROR("TvConfigStore: '{}' is a symbolic link, refusing to write", target.string());
        return ConfigStatus::error(ConfigErrc::WriteFailed, EPERM, "target is a symbolic link");
    }

    std::string tmpl = (parent / (target.filename().string() + ".tmp.XXXXXX")).string();
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');
    const int fd = ::mkstemp(tmpl_buf.data());
    if (fd == -1)
    {
        const int errnum = errno;
        LOGGER_ERROR("TvConfigStore: mkstemp failed for '{}': {}", tmpl_buf.data(),
                     std::strerror(errnum));
        return ConfigStatus::error(ConfigErrc::WriteFailed, errnum, std::strerror(errnum));
    }
    const std::string tmp_path(tmpl_buf.data());
    auto cleanup = basics::make_scope_guard([&tmp_path] { ::unlink(tmp_path.c_str()); });

    const char *data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0)
    {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const int errnum = errno;
            ::close(fd);
            LOGGER_ERROR("TvConfigStore: write failed for '{}': {}", tmp_path, std::strerror(errnum));
            return ConfigStatus::error(ConfigErrc::WriteFailed, errnum, std::strerror(errnum));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    if (::fsync(fd) != 0 || ::close(fd) != 0)
    {
        const int errnum = errno;
        LOGGER_ERROR("TvConfigStore: fsync/close failed for '{}': {}", tmp_path,
                     std::strerror(errnum));
        return ConfigStatus::error(ConfigErrc::WriteFailed, errnum, std::strerror(errnum));
    }
    if (::rename(tmp_path.c_str(), target.c_str()) != 0)
    {
        const int errnum = errno;
        LOGGER_ERROR("TvConfigStore: rename '{}' -> '{}' failed: {}", tmp_path, target.string(),
                     std::strerror(errnum));
        return ConfigStatus::error(ConfigErrc::WriteFailed, errnum, std::strerror(errnum));
    }
    cleanup.dismiss();
    return ConfigStatus::ok();
}

} // namespace

const char *to_string(ConfigErrc err) noexcept
{
    switch (err)
    {
    case ConfigErrc::NoLocation:
        return "NoLocation";
    case ConfigErrc::Unreadable:
        return "Unreadable";
    case ConfigErrc::Malformed:
        return "Malformed";
    case ConfigErrc::WriteFailed:
        return "WriteFailed";
    case ConfigErrc::UnknownTv:
        return "UnknownTv";
    case ConfigErrc::NoDefault:
        return "NoDefault";
    }
    return "Unknown";
}

// ============================================================================
// TvEntry
// ============================================================================

nlohmann::json TvEntry::to_json() const
{
    return {{"name", name},
            {"ip", ip},
            {"mac", nullable(mac)},
            {"key", nullable(key)},
            {"hostname", nullable(hostname)}};
}

TvEntry TvEntry::from_json(const std::string &name, const nlohmann::json &j)
{
    TvEntry entry;
    entry.name = optional_string(j, "name").value_or(name);
    entry.ip = optional_string(j, "ip").value_or(std::string());
    entry.mac = optional_string(j, "mac");
    entry.key = optional_string(j, "key");
    entry.hostname = optional_string(j, "hostname");
    return entry;
}

// ============================================================================
// TvConfigStore
// ============================================================================

std::vector<fs::path> TvConfigStore::search_paths()
{
    std::vector<fs::path> paths;
    if (auto explicit_path = env_path("LGTV_CONFIG"))
    {
        paths.push_back(*explicit_path);
    }
    paths.emplace_back("/etc/lgtv/config.json");
    const auto home = env_path("HOME");
    if (auto xdg = env_path("XDG_CONFIG_HOME"))
    {
        paths.push_back(*xdg / "lgtv" / "config.json");
    }
    else if (home)
    {
        paths.push_back(*home / ".config" / "lgtv" / "config.json");
    }
    if (home)
    {
        paths.push_back(*home / ".lgtv" / "config.json");
    }
    paths.emplace_back("/opt/venvs/lgtv/config/config.json");
    return paths;
}

ConfigResult<fs::path> TvConfigStore::locate()
{
    const auto paths = search_paths();
    std::error_code ec;
    for (const auto &candidate : paths)
    {
        if (fs::is_regular_file(candidate, ec) && is_writable(candidate))
        {
            return ConfigResult<fs::path>::ok(candidate);
        }
    }
    for (const auto &candidate : paths)
    {
        const auto dir = candidate.parent_path();
        if (fs::is_directory(dir, ec))
        {
            if (is_writable(dir))
            {
                return ConfigResult<fs::path>::ok(candidate);
            }
            continue;
        }
        if (fs::is_directory(dir.parent_path(), ec) && fs::create_directories(dir, ec) && !ec)
        {
            return ConfigResult<fs::path>::ok(candidate);
        }
        LOGGER_DEBUG("TvConfigStore: cannot use {}: {}", dir.string(),
                     ec ? ec.message() : std::string("parent missing"));
    }

    std::vector<std::string> shown;
    for (const auto &p : paths)
    {
        shown.push_back(p.string());
    }
    return ConfigResult<fs::path>::error(
        ConfigErrc::NoLocation, 0,
        fmt::format("cannot find a writable config location; create one of {}",
                    fmt::join(shown, " or ")));
}

TvConfigStore::TvConfigStore(fs::path path) : m_path(std::move(path)) {}

ConfigStatus TvConfigStore::load()
{
    std::error_code ec;
    if (!fs::exists(m_path, ec))
    {
        m_doc = nlohmann::json::object();
        return ConfigStatus::ok();
    }
    std::ifstream in(m_path);
    if (!in)
    {
        return ConfigStatus::error(ConfigErrc::Unreadable, errno,
                                   fmt::format("cannot read {}", m_path.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto doc = nlohmann::json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
    {
        LOGGER_WARN("TvConfigStore: {} is not a JSON object", m_path.string());
        return ConfigStatus::error(ConfigErrc::Malformed, 0,
                                   fmt::format("{} is not a JSON object", m_path.string()));
    }
    m_doc = std::move(doc);
    return ConfigStatus::ok();
}

ConfigStatus TvConfigStore::save() const
{
    auto status = atomic_write(m_path, m_doc.dump(4) + "\n");
    if (status.is_ok())
    {
        LOGGER_DEBUG("TvConfigStore: wrote {}", m_path.string());
    }
    return status;
}

std::optional<TvEntry> TvConfigStore::get_tv(const std::string &name) const
{
    if (name == kDefaultKey)
    {
        return std::nullopt;
    }
    auto it = m_doc.find(name);
    if (it == m_doc.end() || !it->is_object())
    {
        return std::nullopt;
    }
    return TvEntry::from_json(name, *it);
}

void TvConfigStore::put_tv(const TvEntry &entry)
{
    m_doc[entry.name] = entry.to_json();
}

std::optional<std::string> TvConfigStore::default_tv() const
{
    return optional_string(m_doc, kDefaultKey);
}

ConfigStatus TvConfigStore::set_default(const std::string &name)
{
    if (!get_tv(name))
    {
        return ConfigStatus::error(ConfigErrc::UnknownTv, 0,
                                   fmt::format("TV '{}' not found in config", name));
    }
    m_doc[kDefaultKey] = name;
    return ConfigStatus::ok();
}

ConfigResult<TvEntry> TvConfigStore::resolve(const std::optional<std::string> &name) const
{
    std::string wanted;
    if (name && !name->empty())
    {
        wanted = *name;
    }
    else if (auto fallback = default_tv())
    {
        wanted = *fallback;
    }
    else
    {
        return ConfigResult<TvEntry>::error(
            ConfigErrc::NoDefault, 0,
            "a TV name is required; set one with --name or the setDefault command");
    }
    auto entry = get_tv(wanted);
    if (!entry)
    {
        return ConfigResult<TvEntry>::error(
            ConfigErrc::UnknownTv, 0,
            fmt::format("no entry with the name '{}' was found in the configuration at {}", wanted,
                        m_path.string()));
    }
    return ConfigResult<TvEntry>::ok(std::move(*entry));
}

std::vector<std::string> TvConfigStore::names() const
{
    std::vector<std::string> out;
    for (const auto &[key, value] : m_doc.items())
    {
        if (key != kDefaultKey && value.is_object())
        {
            out.push_back(key);
        }
    }
    return out;
}

} // namespace lgtv::cli
