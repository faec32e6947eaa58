#include "debug.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace xclone {
namespace {

auto ToLower(std::string value) -> std::string {
	std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
		return static_cast<char>(std::tolower(ch));
	});
	return value;
}

auto Trim(const std::string& value) -> std::string {
	auto begin = value.find_first_not_of(" \t");
	if (begin == std::string::npos) {
		return {};
	}
	auto end = value.find_last_not_of(" \t");
	return value.substr(begin, end - begin + 1);
}

} // anonymous namespace

auto DebugCategoryName(DebugCategory category) -> const char* {
	switch (category) {
#define V(name) case DebugCategory::name: return #name;
		XCLONE_DEBUG_CATEGORY_NAMES(V)
#undef V
	}
	return "UNKNOWN";
}

void EnabledDebugList::Parse() {
	const char* categories = std::getenv("XCLONE_DEBUG");
	if (categories != nullptr) {
		Parse(categories);
	}
}

void EnabledDebugList::Parse(const std::string& categories) {
	std::string::size_type begin = 0;
	while (begin <= categories.size()) {
		auto comma = categories.find(',', begin);
		auto wanted = ToLower(Trim(categories.substr(begin, comma == std::string::npos ? std::string::npos : comma - begin)));
		if (wanted == "*" || wanted == "all") {
#define V(name) set_enabled(DebugCategory::name);
			XCLONE_DEBUG_CATEGORY_NAMES(V)
#undef V
		} else if (!wanted.empty()) {
#define V(name) \
			if (wanted == ToLower(#name)) { \
				set_enabled(DebugCategory::name); \
			}
			XCLONE_DEBUG_CATEGORY_NAMES(V)
#undef V
		}
		if (comma == std::string::npos) {
			break;
		}
		begin = comma + 1;
	}
}

namespace per_process {

auto enabled_debug_list() -> const EnabledDebugList& {
	static const EnabledDebugList list = []() {
		EnabledDebugList list;
		list.Parse();
		return list;
	}();
	return list;
}

} // namespace per_process
} // namespace xclone
