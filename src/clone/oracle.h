#pragma once
#include "host/host_environment.h"
#include <v8.h>

namespace xclone {

// Browser family whose `postMessage` rejects native errors even though a ponyfill accepts them
constexpr auto kErrorRejectingBrowserFamily = "firefox";

/**
 * Same test as lodash's `isError`: the `Error` / `DOMException` brand, or anything that isn't a
 * plain object but has string `message` and `name` properties. `message` and `name` are read with
 * ordinary lookups, so accessors on the value run.
 */
auto IsErrorLike(v8::Local<v8::Value> value) -> bool;

/**
 * Decides whether a single value can be sent over the host's transport. Failures inside the clone
 * capability are answers, not errors, and are never rethrown.
 */
class SerializabilityOracle {
	public:
		explicit SerializabilityOracle(const HostEnvironment& environment) : environment{environment} {}

		auto IsSerializable(v8::Local<v8::Value> value) const -> bool;

	private:
		auto RejectedByHostTransport(v8::Local<v8::Value> value) const -> bool;

		const HostEnvironment& environment;
};

} // namespace xclone
