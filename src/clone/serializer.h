#pragma once
#include "capability.h"
#include <cstdint>
#include <v8.h>

namespace xclone {
namespace detail {

/**
 * Serializer delegate used for dry-run serialization. Nothing is kept after the write finishes so
 * SharedArrayBuffers only need a distinct id.
 */
class CloneCheckDelegate : public v8::ValueSerializer::Delegate {
	public:
		void ThrowDataCloneError(v8::Local<v8::String> message) final;

		auto GetSharedArrayBufferId(
			v8::Isolate* isolate, v8::Local<v8::SharedArrayBuffer> shared_array_buffer) -> v8::Maybe<uint32_t> final;

	private:
		uint32_t shared_array_buffer_count = 0;
};

} // namespace detail

/**
 * v8's own structured clone. The value is written to a throwaway `ValueSerializer` buffer which is
 * freed as soon as the check is done.
 */
class StructuredCloneCapability : public CloneCapability {
	public:
		void Check(v8::Local<v8::Value> value) const final;
		auto Name() const -> const char* final { return "v8::ValueSerializer"; }
};

} // namespace xclone
