#include "serializer.h"
#include "isolate/generic/error.h"

/**
 * This file is compiled *without* runtime type information, which matches the nodejs binary and
 * allows the serializer delegates to resolve correctly.
 */

using namespace v8;

namespace xclone {
namespace detail {

void CloneCheckDelegate::ThrowDataCloneError(Local<String> message) {
	Isolate::GetCurrent()->ThrowException(Exception::TypeError(message));
}

auto CloneCheckDelegate::GetSharedArrayBufferId(
		Isolate* /*isolate*/, Local<SharedArrayBuffer> /*shared_array_buffer*/) -> Maybe<uint32_t> {
	auto result = Nothing<uint32_t>();
	RunBarrier([&]() {
		result = Just<uint32_t>(shared_array_buffer_count++);
	});
	return result;
}

} // namespace detail
} // namespace xclone
