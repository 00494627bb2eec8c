#pragma once

#ifndef DEMOJI_VERSION_STRING
#define DEMOJI_VERSION_STRING "0.1.0"
#endif

namespace app
{

constexpr const char* kProgramName = "demoji";
constexpr const char* kVersion = DEMOJI_VERSION_STRING;

} // namespace app
