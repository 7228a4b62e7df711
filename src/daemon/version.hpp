#pragma once

inline constexpr const char* kServerVersion = RCMCP_VERSION;
