#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <v8.h>

namespace xclone {

/**
 * JS + C++ exceptions, use with care
 */

// `RuntimeError` can be thrown when v8 already has an exception on deck
class RuntimeError : public std::exception {};

namespace detail {

// `RuntimeErrorWithMessage` is a general error that has an error message with it
class RuntimeErrorWithMessage : public RuntimeError {
	public:
		explicit RuntimeErrorWithMessage(std::string message) : message{std::move(message)} {}

		auto GetMessage() const -> const std::string& {
			return message;
		}

		auto what() const noexcept -> const char* final {
			return message.c_str();
		}

	private:
		std::string message;
};

// `RuntimeErrorConstructible` is an abstract error that can be imported back into v8
class RuntimeErrorConstructible : public RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
	public:
		virtual auto ConstructError() const -> v8::Local<v8::Value> = 0;
};

// `RuntimeErrorWithConstructor` can be used to construct any of the `v8::Exception` errors
template <v8::Local<v8::Value> (*Error)(v8::Local<v8::String>)>
class RuntimeErrorWithConstructor : public RuntimeErrorConstructible {
	using RuntimeErrorConstructible::RuntimeErrorConstructible;
	public:
		auto ConstructError() const -> v8::Local<v8::Value> final {
			v8::Isolate* isolate = v8::Isolate::GetCurrent();
			v8::Local<v8::String> message_handle;
			if (v8::String::NewFromUtf8(isolate, GetMessage().c_str(), v8::NewStringType::kNormal).ToLocal(&message_handle)) {
				return Error(message_handle);
			}
			// An empty handle here means v8 has an exception on deck already
			return {};
		}
};

} // namespace detail

// `FatalRuntimeError` is for very bad situations, like execution being terminated mid-walk
class FatalRuntimeError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

// These correspond to the given JS error types
using RuntimeGenericError = detail::RuntimeErrorWithConstructor<v8::Exception::Error>;
using RuntimeTypeError = detail::RuntimeErrorWithConstructor<v8::Exception::TypeError>;
using RuntimeRangeError = detail::RuntimeErrorWithConstructor<v8::Exception::RangeError>;

/**
 * Convert a MaybeLocal<T> to Local<T> and throw an error if it's empty. Someone else should throw
 * the v8 exception.
 */
template <class Type>
auto Unmaybe(v8::Maybe<Type> handle) -> Type {
	Type just;
	if (handle.To(&just)) {
		return just;
	} else {
		throw RuntimeError();
	}
}

template <class Type>
auto Unmaybe(v8::MaybeLocal<Type> handle) -> v8::Local<Type> {
	v8::Local<Type> local;
	if (handle.ToLocal(&local)) {
		return local;
	} else {
		throw RuntimeError();
	}
}

namespace detail {

template <class Functor>
inline void RunBarrier(Functor fn) {
	// Runs a function and converts C++ errors to immediate v8 errors. Used inside v8 delegate
	// callbacks where a C++ exception must not unwind through v8 frames.
	try {
		fn();
	} catch (const FatalRuntimeError& cc_error) {
		// Execution is terminating
	} catch (const detail::RuntimeErrorConstructible& cc_error) {
		v8::Isolate::GetCurrent()->ThrowException(cc_error.ConstructError());
	} catch (const RuntimeError& cc_error) {
		// A JS error is waiting in the isolate
	}
}

} // namespace detail
} // namespace xclone
