#include "client/dsn.hpp"
#include "core/utils.hpp"

#include <regex>

namespace tracesdk {

namespace {

constexpr const char* kProtocolVersion = "7";

// protocol, public_key, pass, host, port, path-with-project
const std::regex& dsn_regex() {
    static const std::regex re(R"(^(\w+)://(\w+)(?::(\w+))?@([\w.-]+)(?::(\d+))?/(.+)$)");
    return re;
}

} // anonymous namespace

Result<Dsn> Dsn::parse(std::string_view dsn) {
    const std::string input(dsn);
    std::smatch m;
    if (!std::regex_match(input, m, dsn_regex())) {
        return Result<Dsn>::error(ErrorCategory::CONFIG_ERROR, "Invalid Dsn: " + input);
    }

    Dsn out;
    out.protocol = m[1].str();
    out.public_key = m[2].str();
    out.pass = m[3].str();
    out.host = m[4].str();
    out.port = m[5].str();

    std::string last_path = m[6].str();
    const auto split = last_path.rfind('/');
    if (split != std::string::npos) {
        out.path = last_path.substr(0, split);
        out.project_id = last_path.substr(split + 1);
    } else {
        out.project_id = std::move(last_path);
    }

    // A trailing query string or fragment is not part of the project id
    const auto query = out.project_id.find_first_of("?#");
    if (query != std::string::npos) {
        out.project_id.erase(query);
    }

    if (out.protocol != "http" && out.protocol != "https") {
        return Result<Dsn>::error(ErrorCategory::CONFIG_ERROR,
            "Invalid Dsn protocol: " + out.protocol);
    }
    if (out.project_id.empty() ||
        out.project_id.find_first_not_of("0123456789") != std::string::npos) {
        return Result<Dsn>::error(ErrorCategory::CONFIG_ERROR,
            "Invalid Dsn project id: " + out.project_id);
    }

    return Result<Dsn>::ok(std::move(out));
}

std::string Dsn::to_string(bool with_password) const {
    std::string s = protocol + "://" + public_key;
    if (with_password && !pass.empty()) s += ":" + pass;
    s += "@" + host;
    if (!port.empty()) s += ":" + port;
    s += "/";
    if (!path.empty()) s += path + "/";
    s += project_id;
    return s;
}

std::string Dsn::api_base_url() const {
    std::string url = protocol + "://" + host;
    if (!port.empty()) url += ":" + port;
    url += "/";
    if (!path.empty()) url += path + "/";
    url += "api/" + project_id + "/";
    return url;
}

std::string Dsn::store_endpoint_with_auth() const {
    return api_base_url() + "store/?" + auth_query();
}

std::string Dsn::envelope_endpoint_with_auth() const {
    return api_base_url() + "envelope/?" + auth_query();
}

std::string Dsn::auth_query() const {
    return "sentry_key=" + utils::url_encode(public_key) +
           "&sentry_version=" + kProtocolVersion;
}

} // namespace tracesdk
