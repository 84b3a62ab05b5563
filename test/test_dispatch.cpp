#include "test_helpers.hpp"
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pyforge;
using namespace pyforge::test;

namespace {

int64_t Add(int64_t a, int64_t b, std::optional<int64_t> c) {
    return a + b + c.value_or(0);
}

int64_t Mul(int64_t a, int64_t b) {
    return a * b;
}

std::string Greet() {
    return "hello";
}

int64_t Sum(std::vector<int64_t> values) {
    int64_t total = 0;
    for (int64_t v : values) total += v;
    return total;
}

Object Identity(Object value) {
    return value;
}

Result<double> Divide(double a, double b) {
    if (b == 0.0) return raise(ExceptionKind::ZeroDivisionError, "division by zero");
    return a / b;
}

Result<void> Check(int64_t value) {
    if (value < 0) return raise(ExceptionKind::ValueError, "negative value");
    return {};
}

std::optional<std::string> Find(std::string key) {
    if (key == "a") return std::string("alpha");
    return std::nullopt;
}

std::optional<int64_t> MisusedOptional() {
    raise(ExceptionKind::ValueError, "lost");
    return std::nullopt;
}

int g_touched = 0;

void Touch(int64_t amount) {
    g_touched += static_cast<int>(amount);
}

void FailQuietly() {
    raise(ExceptionKind::KeyError, "procedure failed");
}

ErrorPending AlwaysFails(std::string why) {
    return raise(ExceptionKind::TypeError, why);
}

PyObject* ForgetsException() {
    return nullptr;
}

int64_t ThrowsNative(int64_t code) {
    if (code == 1) throw Exception(ExceptionKind::IndexError, "thrown index");
    throw std::runtime_error("thrown runtime");
}

int64_t Scale(int64_t value) {
    return value * 10;
}

int64_t Unnamed(int64_t value) {
    return value;
}

int64_t Misnamed(int64_t value) {
    return value;
}

int64_t Tally(int64_t value) {
    return value;
}

std::string ClassNameOf(Object cls) {
    ScopedRef name(cls.get_attr("__name__"));
    if (!name) return std::string();
    return name->as<std::string>().value_or("");
}

ModuleDescriptor& DispatchModule() {
    static ClassDescriptor tools = MakeClass<>("Tools", "Helpers without instance state");
    static ModuleDescriptor module = [] {
        ModuleDescriptor m("dispatch", "dispatch adapter tests");
        m.def(function<&Add>("add", { .doc = "Add two or three integers", .args = { "a", "b", "c" } }));
        m.def(function<&Add>("plus", { .args = { "x", "y", "z" } }));
        m.def(function<&Add>("total", { .args = { "a", "b", "c" } }));
        m.def(function<&Mul>("mul"));
        m.def(function<&Greet>("greet"));
        m.def(function<&Sum>("sum", { .args = { "values" } }));
        m.def(function<&Identity>("identity"));
        m.def(function<&Divide>("divide", { .args = { "a", "b" } }));
        m.def(function<&Check>("check"));
        m.def(function<&Find>("find"));
        m.def(function<&MisusedOptional>("misused_optional"));
        m.def(function<&Touch>("touch"));
        m.def(function<&FailQuietly>("fail_quietly"));
        m.def(function<&AlwaysFails>("always_fails"));
        m.def(function<&ForgetsException>("forgets_exception"));
        m.def(function<&ThrowsNative>("throws_native"));

        tools.def(staticmethod<&Scale>("scale", { .args = { "value" } }));
        tools.def(classmethod<&ClassNameOf>("class_name"));
        m.add_class(tools);
        return m;
    }();
    return module;
}

} // namespace

// ============================================================================
// Argument binding
// ============================================================================

TEST(DispatchTests, PositionalAndKeywordBinding) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    EXPECT_EQ(box.eval_as<int64_t>("dispatch.add(2, 3)"), 5);
    EXPECT_EQ(box.eval_as<int64_t>("dispatch.add(2, 3, 4)"), 9);
    EXPECT_EQ(box.eval_as<int64_t>("dispatch.add(2, 3, c=4)"), 9);
    EXPECT_EQ(box.eval_as<int64_t>("dispatch.add(b=3, a=2)"), 5);
    EXPECT_EQ(box.eval_as<int64_t>("dispatch.add(2, 3, None)"), 5);
}

TEST(DispatchTests, MissingArgument) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    PendingError err = box.eval_error("dispatch.add(2)");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "add() missing required argument 'b'");
}

TEST(DispatchTests, TooManyArguments) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    PendingError err = box.eval_error("dispatch.add(1, 2, 3, 4)");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "add() expected 2 to 3 arguments, got 4");

    err = box.eval_error("dispatch.mul(1)");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "mul() expected 2 arguments, got 1");
}

TEST(DispatchTests, UnknownKeyword) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    PendingError err = box.eval_error("dispatch.add(a=9, b=1, z=1)");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "add() got an unexpected keyword argument 'z'");
}

TEST(DispatchTests, DuplicateBinding) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    PendingError err = box.eval_error("dispatch.add(2, 3, 4, c=4)");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "add() got multiple values for argument 'c'");

    err = box.eval_error("dispatch.add(2, 3, b=1)");
    EXPECT_EQ(err.message, "add() got multiple values for argument 'b'");
}

TEST(DispatchTests, PositionalOnlyRejectsKeywords) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    EXPECT_EQ(box.eval_as<int64_t>("dispatch.mul(6, 7)"), 42);
    PendingError err = box.eval_error("dispatch.mul(6, b=7)");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_NE(err.message.find("keyword"), std::string::npos);
}

TEST(DispatchTests, ZeroArityFunction) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    EXPECT_EQ(box.eval_as<std::string>("dispatch.greet()"), "hello");
    EXPECT_EQ(box.eval_error("dispatch.greet(1)").type, "TypeError");
}

TEST(DispatchTests, ConversionFailureNamesType) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    PendingError err = box.eval_error("dispatch.add('x', 1)");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "expected int");

    err = box.eval_error("dispatch.add(1, 2**70)");
    EXPECT_EQ(err.type, "OverflowError");

    EXPECT_EQ(box.eval_as<int64_t>("dispatch.sum([1, 2, 3])"), 6);
    EXPECT_EQ(box.eval_as<int64_t>("dispatch.sum(values=(4, 5))"), 9);
    EXPECT_EQ(box.eval_error("dispatch.sum([1, None])").message, "expected int");

    // Text without a UTF-8 form fails the call before the body runs
    err = box.eval_error("dispatch.always_fails('\\udcff')");
    EXPECT_EQ(err.type, "UnicodeEncodeError");
}

// ============================================================================
// Reference balance
// ============================================================================

TEST(DispatchTests, RefcountsStayBalanced) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    ASSERT_TRUE(box.exec(
        "import sys\n"
        "canary = object()\n"
        "before = sys.getrefcount(canary)\n"
        "for _ in range(1000):\n"
        "    dispatch.identity(canary)\n"
        "    try:\n"
        "        dispatch.add(canary, 1)\n"
        "    except TypeError:\n"
        "        pass\n"
        "    try:\n"
        "        dispatch.add(1, 2, c=canary)\n"
        "    except TypeError:\n"
        "        pass\n"
        "after = sys.getrefcount(canary)\n"));
    EXPECT_EQ(box.eval_as<int64_t>("after - before"), 0);
    EXPECT_EQ(box.eval_as<bool>("dispatch.identity(canary) is canary"), true);
}

// ============================================================================
// Return conventions
// ============================================================================

TEST(DispatchTests, ResultReturns) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    EXPECT_DOUBLE_EQ(box.eval_as<double>("dispatch.divide(1, 4)").value(), 0.25);
    PendingError err = box.eval_error("dispatch.divide(1, b=0)");
    EXPECT_EQ(err.type, "ZeroDivisionError");
    EXPECT_EQ(err.message, "division by zero");

    EXPECT_EQ(box.eval_as<bool>("dispatch.check(3) is None"), true);
    EXPECT_EQ(box.eval_error("dispatch.check(-1)").type, "ValueError");
}

TEST(DispatchTests, OptionalReturnsMapToNone) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    EXPECT_EQ(box.eval_as<std::string>("dispatch.find('a')"), "alpha");
    EXPECT_EQ(box.eval_as<bool>("dispatch.find('b') is None"), true);

    PendingError err = box.eval_error("dispatch.misused_optional()");
    EXPECT_EQ(err.type, "RuntimeError");
    EXPECT_EQ(err.message, "optional returns cannot signal errors; use Result<T>");
}

TEST(DispatchTests, VoidReturns) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    g_touched = 0;
    EXPECT_EQ(box.eval_as<bool>("dispatch.touch(4) is None"), true);
    EXPECT_EQ(g_touched, 4);

    PendingError err = box.eval_error("dispatch.fail_quietly()");
    EXPECT_EQ(err.type, "KeyError");
    EXPECT_EQ(err.message, "procedure failed");
}

TEST(DispatchTests, NoReturnFunctionsAlwaysRaise) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    PendingError err = box.eval_error("dispatch.always_fails('because')");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "because");
}

TEST(DispatchTests, NullWithoutExceptionIsInternalError) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    PendingError err = box.eval_error("dispatch.forgets_exception()");
    EXPECT_EQ(err.type, "SystemError");
    EXPECT_EQ(err.message, "forgets_exception reported failure without setting an exception");
}

TEST(DispatchTests, NativeExceptionsAreTranslated) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    PendingError err = box.eval_error("dispatch.throws_native(1)");
    EXPECT_EQ(err.type, "IndexError");
    EXPECT_EQ(err.message, "thrown index");

    err = box.eval_error("dispatch.throws_native(2)");
    EXPECT_EQ(err.type, "RuntimeError");
    EXPECT_EQ(err.message, "thrown runtime");
}

// ============================================================================
// Static and class methods
// ============================================================================

TEST(DispatchTests, StaticAndClassMethods) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    EXPECT_EQ(box.eval_as<int64_t>("dispatch.Tools.scale(4)"), 40);
    EXPECT_EQ(box.eval_as<int64_t>("dispatch.Tools().scale(value=5)"), 50);
    EXPECT_EQ(box.eval_as<std::string>("dispatch.Tools.class_name()"), "Tools");

    // Not subclassable without base()
    EXPECT_FALSE(box.exec("class Derived(dispatch.Tools):\n    pass\n"));
    EXPECT_EQ(TakeError().type, "TypeError");
}

// ============================================================================
// Descriptor contents
// ============================================================================

TEST(DispatchTests, DescriptorSchema) {
    MethodDescriptor desc = function<&Add>("add", { .doc = "Add two or three integers", .args = { "a", "b", "c" } });
    EXPECT_TRUE(desc.error.empty());
    EXPECT_EQ(desc.kind, MethodKind::Function);
    EXPECT_FALSE(desc.has_receiver);
    EXPECT_EQ(desc.flags, METH_VARARGS | METH_KEYWORDS);
    ASSERT_TRUE(desc.schema);
    EXPECT_EQ(desc.schema->required, 2u);
    EXPECT_EQ(desc.schema->total, 3u);
    ASSERT_EQ(desc.params.size(), 3u);
    EXPECT_EQ(desc.params[2].name, "c");
    EXPECT_EQ(desc.params[2].type, "Optional[int]");
    EXPECT_TRUE(desc.params[2].optional);
    EXPECT_EQ(desc.return_type, "int");

    MethodDescriptor greet = function<&Greet>("greet");
    EXPECT_EQ(greet.flags, METH_NOARGS);

    MethodDescriptor scale = staticmethod<&Scale>("scale", { .args = { "value" } });
    EXPECT_EQ(scale.flags, METH_VARARGS | METH_KEYWORDS | METH_STATIC);
}

TEST(DispatchTests, RegistrationErrorsAreRecorded) {
    MethodDescriptor unnamed = function<&Unnamed>("");
    EXPECT_EQ(unnamed.error, "native function registered without a name");

    MethodDescriptor wrong_names = function<&Misnamed>("misnamed", { .args = { "value", "extra" } });
    EXPECT_EQ(wrong_names.error, "misnamed(): 2 argument names given for 1 parameters");

    // Every binding of Tally is taken; the next distinct name is refused
    for (int i = 0; i < static_cast<int>(kMaxBindings); ++i) {
        std::string name = "tally" + std::to_string(i);
        EXPECT_TRUE(function<&Tally>(name.c_str()).error.empty()) << name;
    }
    MethodDescriptor overflow = function<&Tally>("tally_extra");
    EXPECT_EQ(overflow.error, "tally_extra: native function registered under more than 8 names");

    // An identical registration reuses its binding
    MethodDescriptor again = function<&Tally>("tally0");
    EXPECT_TRUE(again.error.empty());
    EXPECT_EQ(again.entry, function<&Tally>("tally0").entry);
}

TEST(DispatchTests, AliasesKeepTheirOwnNames) {
    Sandbox box(DispatchModule());
    ASSERT_TRUE(box.ok());

    EXPECT_EQ(box.eval_as<int64_t>("dispatch.plus(1, 2)"), 3);
    EXPECT_EQ(box.eval_as<int64_t>("dispatch.plus(x=1, y=2, z=3)"), 6);
    EXPECT_EQ(box.eval_as<int64_t>("dispatch.total(1, 2, c=3)"), 6);

    PendingError err = box.eval_error("dispatch.plus(1)");
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "plus() missing required argument 'y'");

    err = box.eval_error("dispatch.total(1)");
    EXPECT_EQ(err.message, "total() missing required argument 'b'");

    // The original registration is untouched
    err = box.eval_error("dispatch.add(1, x=2)");
    EXPECT_EQ(err.message, "add() got an unexpected keyword argument 'x'");
}
