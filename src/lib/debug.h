#pragma once
#include <cstdio>
#include <string>
#include <unistd.h>

// Only the category check is inlined at the call site, the formatting stays out of the hot path
#ifdef __GNUC__
#define XCLONE_FORCE_INLINE __attribute__((always_inline))
#define XCLONE_COLD_NOINLINE __attribute__((cold, noinline))
#else
#define XCLONE_FORCE_INLINE
#define XCLONE_COLD_NOINLINE
#endif

namespace xclone {

#define XCLONE_DEBUG_CATEGORY_NAMES(V) \
	V(ENVIRONMENT) \
	V(ORACLE) \
	V(FLATTEN) \
	V(SANITIZE)

enum class DebugCategory : unsigned int {
#define V(name) name,
	XCLONE_DEBUG_CATEGORY_NAMES(V)
#undef V
};

#define V(name) +1
constexpr unsigned int kDebugCategoryCount = XCLONE_DEBUG_CATEGORY_NAMES(V);
#undef V

auto DebugCategoryName(DebugCategory category) -> const char*;

/**
 * Set of enabled debug categories, read from a comma separated list such as
 * `XCLONE_DEBUG=oracle,flatten`. `*` and `all` enable every category.
 */
class EnabledDebugList {
	public:
		XCLONE_FORCE_INLINE auto enabled(DebugCategory category) const -> bool {
			return enabled_[static_cast<unsigned int>(category)];
		}

		// Uses the XCLONE_DEBUG environment variable
		void Parse();
		void Parse(const std::string& categories);

	private:
		void set_enabled(DebugCategory category) {
			enabled_[static_cast<unsigned int>(category)] = true;
		}

		bool enabled_[kDebugCategoryCount] = {false};
};

namespace per_process {

// Parsed from the environment the first time it is requested
auto enabled_debug_list() -> const EnabledDebugList&;

template <class... Args>
XCLONE_COLD_NOINLINE void UnconditionalDebug(DebugCategory category, const char* format, Args... args) {
	std::fprintf(stderr, "XCLONE %s %d: ", DebugCategoryName(category), static_cast<int>(getpid()));
	if constexpr (sizeof...(Args) == 0) {
		std::fputs(format, stderr);
	} else {
		std::fprintf(stderr, format, args...); // NOLINT(cppcoreguidelines-pro-type-vararg)
	}
	std::fputc('\n', stderr);
}

template <class... Args>
XCLONE_FORCE_INLINE inline void Debug(DebugCategory category, const char* format, Args... args) {
	if (enabled_debug_list().enabled(category)) {
		UnconditionalDebug(category, format, args...);
	}
}

} // namespace per_process
} // namespace xclone
