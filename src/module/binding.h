#pragma once
#include <v8.h>

namespace xclone {

/**
 * Installs `isSerializable`, `omitUnserializable`, `sanitizeForTransport` and `UNSERIALIZABLE` on
 * `target`. Each function takes an optional trailing `options` object describing the host.
 */
void InitializeBinding(v8::Local<v8::Context> context, v8::Local<v8::Object> target);

} // namespace xclone
