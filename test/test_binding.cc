#include "isolate_test_fixture.h"
#include "module/binding.h"

using namespace v8;

class BindingTest : public IsolateTestFixture {
	protected:
		void SetUp() override {
			IsolateTestFixture::SetUp();
			xclone::InitializeBinding(context_, context_->Global());
		}
};

TEST_F(BindingTest, Exports) {
	EXPECT_TRUE(RunBool("typeof isSerializable === 'function' && isSerializable.name === 'isSerializable'"));
	EXPECT_TRUE(RunBool("typeof omitUnserializable === 'function'"));
	EXPECT_TRUE(RunBool("typeof sanitizeForTransport === 'function'"));
	EXPECT_TRUE(RunBool("UNSERIALIZABLE === '__xclone_unserializable_value'"));
	EXPECT_TRUE(RunBool("UNSERIALIZABLE = 'changed'; UNSERIALIZABLE === '__xclone_unserializable_value'"));
}

TEST_F(BindingTest, IsSerializable) {
	EXPECT_TRUE(RunBool("isSerializable(1) === true"));
	EXPECT_TRUE(RunBool("isSerializable({ a: [1, 2] }) === true"));
	EXPECT_TRUE(RunBool("isSerializable(Symbol()) === false"));
	EXPECT_TRUE(RunBool("isSerializable(() => 1) === false"));
	EXPECT_TRUE(RunBool("isSerializable() === true"));
}

TEST_F(BindingTest, SanitizeForTransport) {
	EXPECT_TRUE(RunBool("JSON.stringify(sanitizeForTransport([1, Symbol(), 2])) === '[1,2]'"));
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  const record = sanitizeForTransport(Object.assign(Object.create({ y: 2 }), { x: 1 }));"
		"  return Object.getPrototypeOf(record) === null && record.x === 1 && record.y === 2;"
		"})()"
	));
	EXPECT_TRUE(RunBool("sanitizeForTransport('text') === 'text'"));
}

TEST_F(BindingTest, SanitizeThrowsTag) {
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  try {"
		"    sanitizeForTransport(Symbol());"
		"  } catch (error) {"
		"    return error === UNSERIALIZABLE;"
		"  }"
		"  return false;"
		"})()"
	));
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  try {"
		"    sanitizeForTransport({ get bad() { throw new Error('getter'); } });"
		"  } catch (error) {"
		"    return error === UNSERIALIZABLE;"
		"  }"
		"  return false;"
		"})()"
	));
}

TEST_F(BindingTest, FunctionsAreRejected) {
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  try {"
		"    sanitizeForTransport(function named() {});"
		"  } catch (error) {"
		"    return error === UNSERIALIZABLE;"
		"  }"
		"  return false;"
		"})()"
	));
	EXPECT_TRUE(RunBool("JSON.stringify(sanitizeForTransport([1, function named() {}, 'c'])) === '[1,\"c\"]'"));
}

TEST_F(BindingTest, DeepNestingThrowsRangeError) {
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  let list = [1];"
		"  for (let ii = 0; ii < 200000; ++ii) list = [list];"
		"  try {"
		"    sanitizeForTransport(list);"
		"  } catch (error) {"
		"    return error instanceof RangeError;"
		"  }"
		"  return false;"
		"})()"
	));
}

TEST_F(BindingTest, OmitUnserializable) {
	EXPECT_TRUE(RunBool("JSON.stringify(omitUnserializable({ a: 1, b: Symbol(), c() {} })) === '{\"a\":1}'"));
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  try {"
		"    omitUnserializable(1);"
		"  } catch (error) {"
		"    return error instanceof TypeError;"
		"  }"
		"  return false;"
		"})()"
	));
}

TEST_F(BindingTest, FirefoxPonyfillOptions) {
	Run(
		"globalThis.firefoxPonyfill = {"
		"  browser: { name: 'Firefox', family: 'firefox', channel: 'stable', majorVersion: 121 },"
		"  nativeStructuredClone: false,"
		"  ponyfill: value => {},"
		"};"
	);
	EXPECT_TRUE(RunBool("isSerializable(new Error('boom'), firefoxPonyfill) === false"));
	EXPECT_TRUE(RunBool("isSerializable(new Error('boom'), { ...firefoxPonyfill, nativeStructuredClone: true }) === true"));
	EXPECT_TRUE(RunBool("isSerializable(new Error('boom'), { ...firefoxPonyfill, browser: { family: 'chromium' } }) === true"));
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  const [record] = sanitizeForTransport([new Error('boom')], firefoxPonyfill);"
		"  return record.message === 'boom' && record.name === 'Error';"
		"})()"
	));
}

TEST_F(BindingTest, StructuredCloneOption) {
	Run("globalThis.rejectAll = { structuredClone: value => { throw new Error('DataCloneError'); } };");
	EXPECT_TRUE(RunBool("isSerializable(1, rejectAll) === false"));
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  const seen = [];"
		"  isSerializable('checked', { structuredClone: value => { seen.push(value); } });"
		"  return seen.length === 1 && seen[0] === 'checked';"
		"})()"
	));
}

TEST_F(BindingTest, InvalidOptions) {
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  try {"
		"    isSerializable(1, { nativeStructuredClone: 'yes' });"
		"  } catch (error) {"
		"    return error instanceof TypeError && error.message.includes('nativeStructuredClone');"
		"  }"
		"  return false;"
		"})()"
	));
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  try {"
		"    isSerializable(1, { ponyfill: 'not a function' });"
		"  } catch (error) {"
		"    return error instanceof TypeError && error.message.includes('ponyfill');"
		"  }"
		"  return false;"
		"})()"
	));
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  try {"
		"    isSerializable(1, { browser: { name: 42 } });"
		"  } catch (error) {"
		"    return error instanceof TypeError && error.message === '`browser.name` must be a string';"
		"  }"
		"  return false;"
		"})()"
	));
	EXPECT_TRUE(RunBool(
		"(() => {"
		"  try {"
		"    isSerializable(1, 'options');"
		"  } catch (error) {"
		"    return error instanceof TypeError;"
		"  }"
		"  return false;"
		"})()"
	));
	EXPECT_TRUE(RunBool("isSerializable(1, { browser: null, ponyfill: undefined }) === true"));
}
