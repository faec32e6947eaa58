#pragma once
#include <v8.h>

namespace xclone {

/**
 * A primitive which answers "can this value cross a structured clone boundary?". `Check` returns
 * normally when the value can be cloned, and throws `RuntimeError` with the clone failure pending
 * in v8 when it can't.
 */
class CloneCapability {
	public:
		CloneCapability() = default;
		CloneCapability(const CloneCapability&) = delete;
		auto operator= (const CloneCapability&) = delete;
		virtual ~CloneCapability() = default;

		virtual void Check(v8::Local<v8::Value> value) const = 0;
		virtual auto Name() const -> const char* = 0;
};

} // namespace xclone
