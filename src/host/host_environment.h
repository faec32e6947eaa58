#pragma once
#include "clone/capability.h"
#include <memory>
#include <string>
#include <vector>

namespace xclone {

/**
 * Browser the driver is running in, as reported by the automation host
 */
struct BrowserIdentity {
	std::string name;
	std::string family;
	std::string channel;
	int major_version = 0;
};

/**
 * Structured browser matcher. Empty fields match anything.
 */
struct BrowserFilter {
	std::string name;
	std::string family;
	std::string channel;
};

/**
 * Everything the serializability checks need to know about the host. The native capability is the
 * host's own `structuredClone`, which may be missing; the fallback stands in for it (a ponyfill)
 * and must always be present.
 */
class HostEnvironment {
	public:
		HostEnvironment(
			BrowserIdentity browser,
			std::unique_ptr<CloneCapability> native_capability,
			std::unique_ptr<CloneCapability> fallback_capability
		);

		// v8's ValueSerializer as both the native primitive and the fallback
		static auto ForBrowser(BrowserIdentity browser) -> HostEnvironment;

		auto Browser() const -> const BrowserIdentity& { return browser; }

		auto IsBrowser(const std::string& matcher) const -> bool;
		auto IsBrowser(const std::vector<std::string>& matchers) const -> bool;
		auto IsBrowser(const BrowserFilter& filter) const -> bool;

		auto ActiveCapability() const -> const CloneCapability&;
		auto UsingNativeCapability() const -> bool { return native_capability != nullptr; }

	private:
		BrowserIdentity browser;
		std::unique_ptr<CloneCapability> native_capability;
		std::unique_ptr<CloneCapability> fallback_capability;
};

} // namespace xclone
