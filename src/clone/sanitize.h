#pragma once
#include "flatten.h"
#include "oracle.h"
#include <cstddef>
#include <exception>
#include <v8.h>
#include <vector>

namespace xclone {

// Thrown into JS (as a bare string) when a value can't be relayed. Compare by identity.
constexpr auto kUnserializable = "__xclone_unserializable_value";

// Arrays nested deeper than this raise `RuntimeRangeError` instead of recursing further
constexpr size_t kMaxSequenceDepth = 1000;

/**
 * The value could not be made serializable. Carries nothing; the message relay only needs to know
 * that it happened.
 */
class Unserializable : public std::exception {
	public:
		auto what() const noexcept -> const char* final { return kUnserializable; }
};

/**
 * Prepares values for a structured clone transport. Errors and other objects become plain records
 * of their serializable properties (prototype chain included), arrays are filtered element-wise,
 * and anything else passes through only if it is serializable as-is.
 */
class TransportSanitizer {
	public:
		explicit TransportSanitizer(const HostEnvironment& environment);
		TransportSanitizer(const TransportSanitizer&) = delete;
		auto operator= (const TransportSanitizer&) = delete;
		~TransportSanitizer() = default;

		auto IsSerializable(v8::Local<v8::Value> value) const -> bool;

		// Shallow filter over own enumerable properties. No recursion and no prototype walk.
		auto OmitUnserializable(v8::Local<v8::Object> object) const -> v8::Local<v8::Object>;

		// Throws `Unserializable`, or `RuntimeRangeError` past `kMaxSequenceDepth` nested arrays
		auto SanitizeForTransport(v8::Local<v8::Value> value) const -> v8::Local<v8::Value>;

	private:
		// `ancestors` holds the arrays currently being sanitized, outermost first
		auto Sanitize(v8::Local<v8::Value> value, std::vector<v8::Local<v8::Array>>& ancestors) const -> v8::Local<v8::Value>;
		auto SanitizeSequence(v8::Local<v8::Array> sequence, std::vector<v8::Local<v8::Array>>& ancestors) const -> v8::Local<v8::Array>;
		auto SanitizeComposite(v8::Local<v8::Object> object) const -> v8::Local<v8::Object>;

		SerializabilityOracle oracle;
		PrototypeChainFlattener flattener;
};

} // namespace xclone
