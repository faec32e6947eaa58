#pragma once
#include <string>
#include <utility>
#include <v8.h>
#include "handle_cast.h"

namespace xclone {

/**
 * Typed access to an optional JS options object. Missing objects and `null` / `undefined` values
 * read as the default. Readers for nested objects remember their path so that type errors name the
 * whole option, e.g. "`browser.name` must be a string".
 */
class OptionReader {
	public:
		explicit OptionReader(v8::Local<v8::Value> options) :
			OptionReader{HandleCast<v8::MaybeLocal<v8::Object>>(options), std::string{}} {}

		template <class Type>
		auto Read(const char* name, Type default_value) const -> Type {
			HandleCastArguments arguments;
			try {
				v8::Local<v8::Object> object;
				if (!options.ToLocal(&object)) {
					return default_value;
				}
				auto key = HandleCast<v8::Local<v8::String>>(name, arguments);
				v8::Local<v8::Value> value = Unmaybe(object->Get(arguments.context, key));
				if (value->IsNullOrUndefined()) {
					return default_value;
				}
				return HandleCast<Type>(value, arguments);
			} catch (const ParamIncorrect& ex) {
				throw RuntimeTypeError{"`"+ Qualify(name)+ "` must be "+ ex.type};
			}
		}

		// An absent nested object reads every property as its default
		auto Nested(const char* name) const -> OptionReader {
			return OptionReader{Read<v8::MaybeLocal<v8::Object>>(name, {}), Qualify(name)};
		}

	private:
		OptionReader(v8::MaybeLocal<v8::Object> options, std::string path) :
			options{options}, path{std::move(path)} {}

		auto Qualify(const char* name) const -> std::string {
			return path.empty() ? std::string{name} : path+ "."+ name;
		}

		v8::MaybeLocal<v8::Object> options;
		std::string path;
};

} // namespace xclone
