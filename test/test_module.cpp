#include "test_helpers.hpp"
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace pyforge;
using namespace pyforge::test;

namespace {

int64_t Version() {
    return 3;
}

std::string Echo(std::string text) {
    return text;
}

int64_t Nameless(int64_t value) {
    return value;
}

int64_t MemberLike(Object self) {
    return self ? 1 : 0;
}

int64_t Probe(Object self) {
    return self ? 2 : 0;
}

std::string BadRepr(Object) {
    return "bad";
}

ModuleDescriptor MakeSettingsModule() {
    ModuleDescriptor m("settings", "Module-level constants and helpers");
    m.attr("VERSION", 3)
        .attr("RATIO", 0.5)
        .attr("ENABLED", true)
        .attr("NAME", "pyforge")
        .attr("NOTHING", nullptr);
    m.def(function<&Version>("version", { .doc = "Return the settings schema version" }));
    m.def(function<&Echo>("echo", { .args = { "text" } }));
    return m;
}

} // namespace

ModuleDescriptor g_settings_module = MakeSettingsModule();

PF_MODULE(settings, g_settings_module)

// ============================================================================
// Module creation
// ============================================================================

TEST(ModuleTests, InitFunctionCreatesModule) {
    ScopedRef module(Object::owned(PyInit_settings()));
    ASSERT_TRUE(module);
    EXPECT_TRUE(PyModule_Check(module.ptr()));
    EXPECT_STREQ(PyModule_GetName(module.ptr()), "settings");

    ScopedRef doc(module->get_attr("__doc__"));
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc->as<std::string>(), "Module-level constants and helpers");
}

TEST(ModuleTests, ImportThroughSysModules) {
    ScopedRef module(Object::owned(PyInit_settings()));
    ASSERT_TRUE(module);
    ScopedRef sys(ImportModule("sys"));
    ScopedRef modules(sys->get_attr("modules"));
    ASSERT_TRUE(modules);
    ASSERT_EQ(PyDict_SetItemString(modules.ptr(), "settings", module.ptr()), 0);

    ScopedRef imported(ImportModule("settings"));
    ASSERT_TRUE(imported);
    EXPECT_EQ(imported.ptr(), module.ptr());

    PyDict_DelItemString(modules.ptr(), "settings");
}

TEST(ModuleTests, Attributes) {
    Sandbox box(g_settings_module);
    ASSERT_TRUE(box.ok());

    EXPECT_EQ(box.eval_as<int64_t>("settings.VERSION"), 3);
    EXPECT_DOUBLE_EQ(box.eval_as<double>("settings.RATIO").value(), 0.5);
    EXPECT_EQ(box.eval_as<bool>("settings.ENABLED is True"), true);
    EXPECT_EQ(box.eval_as<std::string>("settings.NAME"), "pyforge");
    EXPECT_EQ(box.eval_as<bool>("settings.NOTHING is None"), true);

    ASSERT_EQ(g_settings_module.attrs().size(), 5u);
    EXPECT_EQ(std::get<int64_t>(g_settings_module.attrs()[0].second), 3);
}

TEST(ModuleTests, FunctionsAndDocs) {
    Sandbox box(g_settings_module);
    ASSERT_TRUE(box.ok());

    EXPECT_EQ(box.eval_as<int64_t>("settings.version()"), 3);
    EXPECT_EQ(box.eval_as<std::string>("settings.echo(text='hi')"), "hi");
    EXPECT_EQ(box.eval_as<std::string>("settings.version.__doc__"), "Return the settings schema version");
    EXPECT_EQ(box.eval_as<bool>("settings.echo.__doc__ is None"), true);
    EXPECT_EQ(box.eval_as<std::string>("settings.version.__name__"), "version");
}

TEST(ModuleTests, EachCreateIsIndependent) {
    ScopedRef first(Object::owned(g_settings_module.create()));
    ScopedRef second(Object::owned(g_settings_module.create()));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(first.ptr(), second.ptr());

    EXPECT_TRUE(first->set_attr("VERSION", 99));
    ScopedRef untouched(second->get_attr("VERSION"));
    EXPECT_EQ(untouched->as<int64_t>(), 3);
}

// ============================================================================
// Registration errors
// ============================================================================

TEST(ModuleTests, UnnamedFunctionFailsCreation) {
    ModuleDescriptor m("broken");
    m.def(function<&Nameless>(nullptr));

    PyObject* module = m.create();
    EXPECT_EQ(module, nullptr);
    PendingError err = TakeError();
    EXPECT_EQ(err.type, "SystemError");
    EXPECT_EQ(err.message, "native function registered without a name");
}

TEST(ModuleTests, MethodOnModuleFailsCreation) {
    ModuleDescriptor m("broken_kind");
    m.def(method<&MemberLike>("member_like"));

    EXPECT_EQ(m.create(), nullptr);
    PendingError err = TakeError();
    EXPECT_EQ(err.type, "SystemError");
    EXPECT_EQ(err.message, "broken_kind.member_like: only module functions can be defined on a module");
}

TEST(ModuleTests, ClassErrorsFailModuleCreation) {
    static ClassDescriptor widget = MakeClass<>("Widget");
    widget.def(function<&Probe>("probe"));

    ModuleDescriptor m("broken_class");
    m.add_class(widget);
    EXPECT_EQ(m.create(), nullptr);
    PendingError err = TakeError();
    EXPECT_EQ(err.type, "SystemError");
    EXPECT_EQ(err.message, "Widget.probe: module functions cannot be class members; use method()");
    EXPECT_EQ(widget.error(), err.message);
}

TEST(ModuleTests, DunderMustBeInstanceMethod) {
    static ClassDescriptor gadget = MakeClass<>("Gadget");
    gadget.def(staticmethod<&BadRepr>("__repr__"));

    ModuleDescriptor m("broken_dunder");
    m.add_class(gadget);
    EXPECT_EQ(m.create(), nullptr);
    EXPECT_EQ(TakeError().message, "Gadget.__repr__ must be an instance method");
}
