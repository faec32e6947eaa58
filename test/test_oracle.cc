#include "isolate_test_fixture.h"
#include "clone/oracle.h"
#include "clone/serializer.h"

using namespace v8;
using namespace xclone;

class OracleTest : public IsolateTestFixture {
	protected:
		auto Serializable(const HostEnvironment& environment, const char* source) -> bool {
			SerializabilityOracle oracle{environment};
			return oracle.IsSerializable(Run(source));
		}
};

TEST_F(OracleTest, NativeAcceptsScalars) {
	auto environment = BrowserEnvironment("chrome");
	for (const char* source : {"undefined", "null", "1", "-0", "NaN", "'text'", "true", "10n"}) {
		EXPECT_TRUE(Serializable(environment, source)) << source;
	}
}

TEST_F(OracleTest, NativeRejectsFunctionsAndSymbols) {
	auto environment = BrowserEnvironment("chrome");
	EXPECT_FALSE(Serializable(environment, "Symbol('nope')"));
	EXPECT_FALSE(Serializable(environment, "(function named() {})"));
	EXPECT_FALSE(Serializable(environment, "(() => 1)"));
	EXPECT_FALSE(Serializable(environment, "({ fn() {} })"));
	EXPECT_FALSE(Serializable(environment, "[1, Symbol()]"));
}

TEST_F(OracleTest, NativeAcceptsComposites) {
	auto environment = BrowserEnvironment("chrome");
	EXPECT_TRUE(Serializable(environment, "({ a: 1, b: [1, 2, { c: 'd' }] })"));
	EXPECT_TRUE(Serializable(environment, "new Map([[1, new Set([2])]])"));
	EXPECT_TRUE(Serializable(environment, "new Date(0)"));
	EXPECT_TRUE(Serializable(environment, "(() => { const self = {}; self.self = self; return self; })()"));
	EXPECT_TRUE(Serializable(environment, "new Uint8Array([1, 2, 3])"));
}

TEST_F(OracleTest, FailuresAreAbsorbed) {
	auto throwing = Run("(value => { throw new Error('never'); })").As<Function>();
	auto environment = PonyfillEnvironment("chrome", throwing);
	TryCatch try_catch{isolate_};
	EXPECT_FALSE(Serializable(environment, "1"));
	EXPECT_FALSE(try_catch.HasCaught());

	auto throws_string = Run("(value => { throw 'bare string'; })").As<Function>();
	auto string_environment = PonyfillEnvironment("chrome", throws_string);
	EXPECT_FALSE(Serializable(string_environment, "'text'"));
	EXPECT_FALSE(try_catch.HasCaught());
}

TEST_F(OracleTest, PonyfillDecides) {
	auto environment = PonyfillEnvironment("chrome", PermissivePonyfill());
	EXPECT_TRUE(Serializable(environment, "({ a: 1 })"));
	EXPECT_FALSE(Serializable(environment, "Symbol()"));
	EXPECT_FALSE(Serializable(environment, "(() => 1)"));
}

TEST_F(OracleTest, PonyfillIsCalledWithValue) {
	auto ponyfill = Run("(value => { globalThis.received = value; })").As<Function>();
	auto environment = PonyfillEnvironment("chrome", ponyfill);
	EXPECT_TRUE(Serializable(environment, "'hello'"));
	EXPECT_TRUE(RunBool("received === 'hello'"));
}

TEST_F(OracleTest, FirefoxPonyfillRejectsErrors) {
	auto environment = PonyfillEnvironment("firefox", PermissivePonyfill());
	EXPECT_FALSE(Serializable(environment, "new Error('boom')"));
	EXPECT_FALSE(Serializable(environment, "new TypeError('boom')"));
	EXPECT_FALSE(Serializable(environment, "(() => { class Custom { constructor() { this.message = 'm'; this.name = 'n'; } } return new Custom(); })()"));
	// Plain objects with the same shape are not errors
	EXPECT_TRUE(Serializable(environment, "({ message: 'm', name: 'n' })"));
	EXPECT_TRUE(Serializable(environment, "'not an error'"));
}

TEST_F(OracleTest, ErrorsPassElsewhere) {
	auto chrome_ponyfill = PonyfillEnvironment("chrome", PermissivePonyfill());
	EXPECT_TRUE(Serializable(chrome_ponyfill, "new Error('boom')"));

	// The native primitive is the transport's own check
	auto firefox_native = BrowserEnvironment("firefox");
	EXPECT_TRUE(Serializable(firefox_native, "new Error('boom')"));
}

TEST_F(OracleTest, ErrorLike) {
	EXPECT_TRUE(IsErrorLike(Run("new Error('x')")));
	EXPECT_TRUE(IsErrorLike(Run("new RangeError('x')")));
	EXPECT_TRUE(IsErrorLike(Run("({ [Symbol.toStringTag]: 'DOMException' })")));
	EXPECT_TRUE(IsErrorLike(Run("Object.assign(Object.create({}), { message: 'm', name: 'n' })")));
	EXPECT_TRUE(IsErrorLike(Run("(() => { class E extends Error {} return new E('x'); })()")));

	EXPECT_FALSE(IsErrorLike(Run("({ message: 'm', name: 'n' })")));
	EXPECT_FALSE(IsErrorLike(Run("Object.assign(Object.create(null), { message: 'm', name: 'n' })")));
	EXPECT_FALSE(IsErrorLike(Run("({ message: 1, name: 'n' })")));
	EXPECT_FALSE(IsErrorLike(Run("Object.assign(() => 1, { message: 'm' })")));
	EXPECT_FALSE(IsErrorLike(Run("'Error'")));
	EXPECT_FALSE(IsErrorLike(Run("null")));
}

TEST_F(OracleTest, ErrorLikeReadsAccessors) {
	auto value = Run(
		"globalThis.reads = 0;"
		"({ get message() { ++reads; return 'm'; }, get name() { ++reads; return 'n'; } })"
	);
	EXPECT_FALSE(IsErrorLike(value));
	EXPECT_TRUE(RunBool("reads === 2"));

	// The firefox ponyfill check reads them again
	auto environment = PonyfillEnvironment("firefox", PermissivePonyfill());
	SerializabilityOracle oracle{environment};
	EXPECT_TRUE(oracle.IsSerializable(value));
	EXPECT_TRUE(RunBool("reads === 4"));
}
