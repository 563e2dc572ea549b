#include "core/client_identity.hpp"
#include <algorithm>
#include <cctype>

namespace voicebridge {
namespace core {

namespace {

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

} // namespace

std::string resolveClientKey(std::string_view forwardedFor, std::string_view remoteAddress) {
    std::string_view first = trim(forwardedFor.substr(0, forwardedFor.find(',')));
    if (!first.empty()) {
        return std::string(first);
    }
    std::string_view remote = trim(remoteAddress);
    return remote.empty() ? std::string("unknown") : std::string(remote);
}

std::string extractAuthToken(std::string_view queryToken, std::string_view authorizationHeader) {
    if (!queryToken.empty()) {
        return std::string(queryToken);
    }
    std::string_view header = trim(authorizationHeader);
    constexpr std::string_view bearer = "bearer ";
    if (header.size() > bearer.size()) {
        std::string prefix(header.substr(0, bearer.size()));
        std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (prefix == bearer) {
            return std::string(trim(header.substr(bearer.size())));
        }
    }
    return "";
}

Authorizer makeTokenAuthorizer(std::vector<std::string> tokens, bool required) {
    if (!required) {
        return [](const std::string&, const std::string&) { return true; };
    }
    return [tokens = std::move(tokens)](const std::string& token, const std::string&) {
        return !token.empty() && std::find(tokens.begin(), tokens.end(), token) != tokens.end();
    };
}

} // namespace core
} // namespace voicebridge
