#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace voicebridge {
namespace core {

/**
 * Decides whether a connection may open a session. The token is empty when
 * the client supplied none.
 */
using Authorizer = std::function<bool(const std::string& token, const std::string& clientKey)>;

// First X-Forwarded-For entry when present, otherwise the socket's remote address
std::string resolveClientKey(std::string_view forwardedFor, std::string_view remoteAddress);

// "token" query parameter value (already extracted), else "Authorization: Bearer <t>"
std::string extractAuthToken(std::string_view queryToken, std::string_view authorizationHeader);

// Accepts everything when not required, otherwise only the listed tokens
Authorizer makeTokenAuthorizer(std::vector<std::string> tokens, bool required);

} // namespace core
} // namespace voicebridge
