#pragma once
// Single Responsibility: one-shot request/reply over a Unix stream socket

#include <optional>
#include <string>

namespace kovak {

// Connects, writes the request and, if expectReply, reads until EOF.
// Returns nullopt if the socket cannot be reached or the write fails.
std::optional<std::string> sendSocketRequest(const std::string& path,
                                             const std::string& request,
                                             bool expectReply,
                                             int timeoutSeconds = 5);

} // namespace kovak
