#pragma once
#include <string>
#include <string_view>

namespace logging {

enum class Type { SpdLog };
enum class Level { Trace, Debug, Info, Warn, Error, Fatal, Off };

inline constexpr std::string_view GLOBAL_TAG = "*";

// "info" -> Level::Info. 알 수 없는 문자열이면 false 반환
bool parseLevel(const std::string& s, Level& level);

const char* levelName(Level level);

} // namespace
