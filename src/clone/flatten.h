#pragma once
#include "oracle.h"
#include <v8.h>
#include <vector>

namespace xclone {

/**
 * Converts an object into a `null` prototype record holding every property, own or inherited,
 * whose value passes the oracle. Names are discovered link by link from the instance up to the
 * root of the prototype chain but values are always read from the instance, so shadowing and
 * getters behave as they would for `object[name]`. The first link which names a property decides
 * its position; each name is read and tested only once.
 *
 * Throws `RuntimeError` if reading the object throws (getters, proxy traps).
 */
class PrototypeChainFlattener {
	public:
		explicit PrototypeChainFlattener(const SerializabilityOracle& oracle) : oracle{oracle} {}

		auto Flatten(v8::Local<v8::Object> object) const -> v8::Local<v8::Object>;

	private:
		// Own string-keyed property names of each chain link, most derived first
		static auto CollectShapes(v8::Local<v8::Context> context, v8::Local<v8::Object> object) -> std::vector<v8::Local<v8::Array>>;

		const SerializabilityOracle& oracle;
};

} // namespace xclone
