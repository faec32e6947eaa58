#include "host_environment.h"
#include "clone/serializer.h"
#include "isolate/generic/error.h"
#include "lib/debug.h"

#include <algorithm>
#include <cctype>

namespace xclone {
namespace {

auto EqualsIgnoreCase(const std::string& left, const std::string& right) -> bool {
	return left.size() == right.size() && std::equal(left.begin(), left.end(), right.begin(), [](unsigned char ll, unsigned char rr) {
		return std::tolower(ll) == std::tolower(rr);
	});
}

auto IsNegated(const std::string& matcher) -> bool {
	return !matcher.empty() && matcher.front() == '!';
}

} // anonymous namespace

HostEnvironment::HostEnvironment(
	BrowserIdentity browser,
	std::unique_ptr<CloneCapability> native_capability,
	std::unique_ptr<CloneCapability> fallback_capability
) :
	browser{std::move(browser)},
	native_capability{std::move(native_capability)},
	fallback_capability{std::move(fallback_capability)} {
	if (!this->fallback_capability) {
		throw RuntimeGenericError("A fallback structured clone capability is required");
	}
	per_process::Debug(DebugCategory::ENVIRONMENT, "browser name=%s family=%s, active capability %s (%s)",
		this->browser.name.c_str(), this->browser.family.c_str(),
		ActiveCapability().Name(), UsingNativeCapability() ? "native" : "fallback");
}

auto HostEnvironment::ForBrowser(BrowserIdentity browser) -> HostEnvironment {
	return HostEnvironment{
		std::move(browser),
		std::make_unique<StructuredCloneCapability>(),
		std::make_unique<StructuredCloneCapability>()
	};
}

auto HostEnvironment::IsBrowser(const std::string& matcher) const -> bool {
	if (IsNegated(matcher)) {
		return !IsBrowser(matcher.substr(1));
	}
	if (matcher.empty()) {
		return false;
	}
	return EqualsIgnoreCase(matcher, browser.name) || EqualsIgnoreCase(matcher, browser.family);
}

auto HostEnvironment::IsBrowser(const std::vector<std::string>& matchers) const -> bool {
	// Exclusions win over inclusions: `["!firefox", "chrome"]` means "anything but firefox"
	bool has_exclusions = std::any_of(matchers.begin(), matchers.end(), IsNegated);
	if (has_exclusions) {
		return std::all_of(matchers.begin(), matchers.end(), [&](const std::string& matcher) {
			return !IsNegated(matcher) || IsBrowser(matcher);
		});
	}
	return std::any_of(matchers.begin(), matchers.end(), [&](const std::string& matcher) {
		return IsBrowser(matcher);
	});
}

auto HostEnvironment::IsBrowser(const BrowserFilter& filter) const -> bool {
	auto field_matches = [](const std::string& expected, const std::string& actual) {
		return expected.empty() || EqualsIgnoreCase(expected, actual);
	};
	return field_matches(filter.name, browser.name) &&
		field_matches(filter.family, browser.family) &&
		field_matches(filter.channel, browser.channel);
}

auto HostEnvironment::ActiveCapability() const -> const CloneCapability& {
	return native_capability ? *native_capability : *fallback_capability;
}

} // namespace xclone
