#pragma once
/**
 * @file endpoint.hpp
 * @brief Endpoint URIs, the tagged request payload and the per-endpoint payload schemas.
 *
 * A request is validated once, at the call boundary: the URI is parsed into an
 * `Endpoint`, the JSON value is wrapped into a `Payload` (object or absent) and the
 * payload is checked against the endpoint's schema from the `EndpointCatalog`. The
 * correlator only ever sees validated values.
 */
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "lgtv_core_export.h"
#include "remote/errors.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lgtv::remote
{

using Json = nlohmann::json;

/**
 * @class Endpoint
 * @brief A `ssap://category/action` (or `luna://service/method`) capability address.
 */
class LGTV_CORE_EXPORT Endpoint
{
  public:
    /// @brief Fails with InvalidEndpoint for an unknown scheme or an empty path.
    static RemoteResult<Endpoint> parse(std::string_view uri);

    const std::string &uri() const noexcept { return m_uri; }
    std::string_view scheme() const noexcept;
    std::string_view path() const noexcept;

    bool operator==(const Endpoint &other) const noexcept { return m_uri == other.m_uri; }

  private:
    Endpoint(std::string uri, size_t scheme_len) : m_uri(std::move(uri)), m_scheme_len(scheme_len) {}

    std::string m_uri;
    size_t m_scheme_len{0};
};

/**
 * @class Payload
 * @brief Request payload: either absent (no "payload" member on the wire) or a JSON object.
 */
class LGTV_CORE_EXPORT Payload
{
  public:
    Payload() = default;

    /// @brief null -> absent; object -> object; anything else fails with InvalidPayload.
    static RemoteResult<Payload> from_json(Json value);

    bool empty() const noexcept { return !m_object.has_value(); }

    /// @brief The object, or an empty object when absent.
    const Json &json() const noexcept;

  private:
    explicit Payload(Json object) : m_object(std::move(object)) {}

    std::optional<Json> m_object;
};

enum class FieldType
{
    Boolean,
    Integer,
    String,
    Object,
    Array,
    Any
};

struct FieldSpec
{
    std::string name;
    FieldType type{FieldType::Any};
    bool required{true};
    std::optional<int64_t> min;
    std::optional<int64_t> max;
};

struct EndpointSchema
{
    std::string uri;
    std::vector<FieldSpec> fields;
    bool subscribable{false};
    bool allow_extra_fields{true};
};

/**
 * @class EndpointCatalog
 * @brief Known endpoints with their payload schemas.
 *
 * Endpoints missing from the catalog are accepted with any object payload.
 */
class LGTV_CORE_EXPORT EndpointCatalog
{
  public:
    EndpointCatalog() = default;

    /// @brief The catalog of endpoints the TV is known to expose.
    static const EndpointCatalog &builtin();

    /// @brief Adds or replaces a schema.
    void add(EndpointSchema schema);

    const EndpointSchema *find(std::string_view uri) const;

    /// @brief InvalidPayload with a message naming the offending field on failure.
    RemoteStatus validate(const Endpoint &endpoint, const Payload &payload) const;

    size_t size() const noexcept { return m_schemas.size(); }

  private:
    std::map<std::string, EndpointSchema, std::less<>> m_schemas;
};

} // namespace lgtv::remote

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
