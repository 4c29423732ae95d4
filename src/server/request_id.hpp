#pragma once

#include <string>

// Random RFC 4122 version 4 UUID, e.g. "3f0c6c8e-2b1d-4f7a-9c55-0e2d9b1a7f43".
std::string generate_request_id();
