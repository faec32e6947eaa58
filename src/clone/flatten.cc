#include "flatten.h"
#include "isolate/util.h"
#include "lib/debug.h"

#include <string>
#include <unordered_set>

using namespace v8;

namespace xclone {

auto PrototypeChainFlattener::CollectShapes(Local<Context> context, Local<Object> object) -> std::vector<Local<Array>> {
	std::vector<Local<Array>> shapes;
	Local<Value> link = object;
	do {
		auto link_object = link.As<Object>();
		shapes.emplace_back(Unmaybe(link_object->GetOwnPropertyNames(
			context, PropertyFilter::SKIP_SYMBOLS, KeyConversionMode::kConvertToString)));
		link = link_object->GetPrototype();
	} while (link->IsObject());
	return shapes;
}

auto PrototypeChainFlattener::Flatten(Local<Object> object) const -> Local<Object> {
	auto* isolate = Isolate::GetCurrent();
	auto context = isolate->GetCurrentContext();

	// Resolve accepted names against the instance
	std::vector<std::pair<Local<Name>, Local<Value>>> accepted;
	std::unordered_set<std::string> tested;
	auto shapes = CollectShapes(context, object);
	for (size_t depth = 0; depth < shapes.size(); ++depth) {
		auto shape = shapes[depth];
		uint32_t length = shape->Length();
		for (uint32_t ii = 0; ii < length; ++ii) {
			auto name = Unmaybe(shape->Get(context, ii)).As<Name>();
			auto key = DescribeKey(name);
			// `__proto__` is the chain link itself, not data
			if (key == "__proto__" || !tested.insert(key).second) {
				continue;
			}
			auto value = Unmaybe(object->Get(context, name));
			if (oracle.IsSerializable(value)) {
				accepted.emplace_back(name, value);
			} else {
				per_process::Debug(DebugCategory::FLATTEN, "omitting `%s` found at chain depth %d", key.c_str(), static_cast<int>(depth));
			}
		}
	}

	// Build the record
	auto record = Object::New(isolate, Null(isolate), nullptr, nullptr, 0);
	for (auto& [name, value] : accepted) {
		Unmaybe(record->CreateDataProperty(context, name, value));
	}
	per_process::Debug(DebugCategory::FLATTEN, "flattened %d chain links into %d properties",
		static_cast<int>(shapes.size()), static_cast<int>(accepted.size()));
	return record;
}

} // namespace xclone
