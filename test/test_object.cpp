#include "test_helpers.hpp"
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace pyforge;
using namespace pyforge::test;

// ============================================================================
// Ownership
// ============================================================================

TEST(ObjectTests, BorrowedHandleNeverReleases) {
    PyObject* raw = PyList_New(0);
    ASSERT_NE(raw, nullptr);
    Py_ssize_t before = Py_REFCNT(raw);

    Object view = Object::borrowed(raw);
    EXPECT_FALSE(view.is_owned());
    EXPECT_EQ(view.refcount(), before);
    view.release();
    EXPECT_FALSE(view.valid());
    EXPECT_EQ(Py_REFCNT(raw), before);

    Py_DECREF(raw);
}

TEST(ObjectTests, OwnedHandleReleasesExactlyOnce) {
    PyObject* raw = PyList_New(0);
    ASSERT_NE(raw, nullptr);
    Py_ssize_t before = Py_REFCNT(raw);

    Object held = Object::acquire(raw);
    EXPECT_TRUE(held.is_owned());
    EXPECT_EQ(Py_REFCNT(raw), before + 1);

    held.release();
    EXPECT_EQ(Py_REFCNT(raw), before);

    // A released handle is empty; a second release is a no-op
    held.release();
    EXPECT_EQ(Py_REFCNT(raw), before);

    Py_DECREF(raw);
}

TEST(ObjectTests, MoveTransfersOwnership) {
    PyObject* raw = PyList_New(0);
    Py_ssize_t before = Py_REFCNT(raw);

    Object a = Object::acquire(raw);
    Object b = std::move(a);
    EXPECT_FALSE(a.valid());
    EXPECT_TRUE(b.is_owned());
    a.release();
    EXPECT_EQ(Py_REFCNT(raw), before + 1);
    b.release();
    EXPECT_EQ(Py_REFCNT(raw), before);

    Py_DECREF(raw);
}

TEST(ObjectTests, MoveAssignReleasesOwnedTarget) {
    PyObject* first = PyList_New(0);
    PyObject* second = PyList_New(0);
    Py_ssize_t first_before = Py_REFCNT(first);
    Py_ssize_t second_before = Py_REFCNT(second);

    Object held = Object::acquire(first);
    held = Object::acquire(second);
    EXPECT_EQ(Py_REFCNT(first), first_before);
    EXPECT_EQ(Py_REFCNT(second), second_before + 1);
    EXPECT_EQ(held.ptr(), second);

    // A borrowed target has nothing to release
    Object view = Object::borrowed(first);
    view = std::move(held);
    EXPECT_EQ(Py_REFCNT(first), first_before);
    view.release();
    EXPECT_EQ(Py_REFCNT(second), second_before);

    Py_DECREF(first);
    Py_DECREF(second);
}

TEST(ObjectTests, ScopedRefReleasesOnScopeExit) {
    PyObject* raw = PyList_New(0);
    Py_ssize_t before = Py_REFCNT(raw);
    {
        ScopedRef ref(Object::acquire(raw));
        EXPECT_EQ(Py_REFCNT(raw), before + 1);
    }
    EXPECT_EQ(Py_REFCNT(raw), before);

    Object kept;
    {
        ScopedRef ref(Object::acquire(raw));
        kept = ref.take();
    }
    EXPECT_EQ(Py_REFCNT(raw), before + 1);
    kept.release();

    Py_DECREF(raw);
}

TEST(ObjectTests, IncrefProducesOwnedHandle) {
    PyObject* raw = PyList_New(0);
    Py_ssize_t before = Py_REFCNT(raw);

    Object view = Object::borrowed(raw);
    Object strong = view.incref();
    EXPECT_TRUE(strong.is_owned());
    EXPECT_EQ(Py_REFCNT(raw), before + 1);
    strong.release();
    EXPECT_EQ(Py_REFCNT(raw), before);

    Py_DECREF(raw);
}

TEST(ObjectTests, StealFromBorrowedAddsReference) {
    PyObject* raw = PyList_New(0);
    Py_ssize_t before = Py_REFCNT(raw);

    Object view = Object::borrowed(raw);
    PyObject* stolen = view.steal();
    EXPECT_EQ(stolen, raw);
    EXPECT_FALSE(view.valid());
    EXPECT_EQ(Py_REFCNT(raw), before + 1);
    Py_DECREF(stolen);

    Py_DECREF(raw);
}

// ============================================================================
// Object operations
// ============================================================================

TEST(ObjectTests, AttributeAccess) {
    ScopedRef math(ImportModule("math"));
    ASSERT_TRUE(math);

    ScopedRef pi(math->get_attr("pi"));
    ASSERT_TRUE(pi);
    EXPECT_TRUE(pi->is_float());
    EXPECT_NEAR(pi->as<double>().value(), 3.14159265, 1e-6);

    Object missing = math->get_attr_or_null("no_such_attribute");
    EXPECT_FALSE(missing.valid());
    EXPECT_FALSE(error_occurred());

    Object failing = math->get_attr("no_such_attribute");
    EXPECT_FALSE(failing.valid());
    EXPECT_EQ(TakeError().type, "AttributeError");
}

TEST(ObjectTests, SetAttrOnModule) {
    ScopedRef types(ImportModule("types"));
    ASSERT_TRUE(types);
    ScopedRef ns(types->call_method("SimpleNamespace"));
    ASSERT_TRUE(ns);

    EXPECT_TRUE(ns->set_attr("answer", 42));
    ScopedRef answer(ns->get_attr("answer"));
    ASSERT_TRUE(answer);
    EXPECT_EQ(answer->as<int>(), 42);
}

TEST(ObjectTests, CallAndCallMethod) {
    ScopedRef builtins(ImportModule("builtins"));
    ASSERT_TRUE(builtins);
    ScopedRef max_fn(builtins->get_attr("max"));
    ASSERT_TRUE(max_fn);
    EXPECT_TRUE(max_fn->is_callable());

    ScopedRef biggest(max_fn->call(3, 9, 4));
    ASSERT_TRUE(biggest);
    EXPECT_EQ(biggest->as<int64_t>(), 9);

    ScopedRef text(to_object(std::string("pyforge")));
    ScopedRef upper(text->call_method("upper"));
    ASSERT_TRUE(upper);
    EXPECT_EQ(upper->as<std::string>(), "PYFORGE");

    ScopedRef joined(to_object(std::string("-")));
    ScopedRef result(joined->call_method("join", std::vector<std::string>{ "a", "b", "c" }));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->as<std::string>(), "a-b-c");
}

TEST(ObjectTests, StrAndTruth) {
    ScopedRef number(to_object(1234));
    ScopedRef text(number->str());
    ASSERT_TRUE(text);
    EXPECT_EQ(text->unicode_view().value(), "1234");

    EXPECT_EQ(number->is_true(), true);
    ScopedRef zero(to_object(0));
    EXPECT_EQ(zero->is_true(), false);
    EXPECT_TRUE(None().is_none());
}

TEST(ObjectTests, Predicates) {
    ScopedRef s(to_object(std::string("x")));
    ScopedRef i(to_object(7));
    ScopedRef f(to_object(2.5));
    ScopedRef b(to_object(true));
    EXPECT_TRUE(s->is_unicode());
    EXPECT_TRUE(i->is_long());
    EXPECT_FALSE(i->is_float());
    EXPECT_TRUE(f->is_float());
    EXPECT_TRUE(b->is_bool());
    EXPECT_TRUE(b->is_long());  // bool is an int subtype
}

TEST(ObjectTests, EmptyHandleKeepsPendingError) {
    ScopedRef math(ImportModule("math"));
    ASSERT_TRUE(math);

    Object missing = math->get_attr("no_such_attr");
    ASSERT_FALSE(missing.valid());
    EXPECT_FALSE(missing.as<int64_t>().has_value());
    EXPECT_EQ(TakeError().type, "AttributeError");

    // Nothing pending: the empty handle itself is the error
    EXPECT_FALSE(missing.as<int64_t>().has_value());
    PendingError err = TakeError();
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "missing argument");

    auto absent = missing.as<std::optional<int64_t>>();
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(absent->has_value());
    EXPECT_FALSE(error_occurred());
}

TEST(ObjectTests, EmptyHandleOperationsFail) {
    Object empty;
    EXPECT_FALSE(empty.is_none());
    EXPECT_FALSE(empty.is_callable());
    EXPECT_FALSE(empty.is_unicode());
    EXPECT_FALSE(empty.is_long());
    EXPECT_FALSE(empty.is_dict());
    EXPECT_EQ(empty.refcount(), 0);
    EXPECT_FALSE(error_occurred());

    EXPECT_FALSE(empty.get_attr("real").valid());
    EXPECT_EQ(TakeError().type, "TypeError");
    EXPECT_FALSE(empty.call(1).valid());
    EXPECT_EQ(TakeError().type, "TypeError");
    EXPECT_FALSE(empty.call_method("upper").valid());
    EXPECT_EQ(TakeError().type, "TypeError");
    EXPECT_FALSE(empty.str().valid());
    EXPECT_EQ(TakeError().type, "TypeError");
    EXPECT_FALSE(empty.is_true().has_value());
    EXPECT_EQ(TakeError().type, "TypeError");
    EXPECT_FALSE(empty.set_attr("x", 1));
    EXPECT_EQ(TakeError().type, "TypeError");
    EXPECT_FALSE(BufferView::get(empty).has_value());
    EXPECT_EQ(TakeError().type, "TypeError");
}

TEST(ObjectTests, UnicodeViewRejectsNonString) {
    ScopedRef i(to_object(7));
    EXPECT_FALSE(i->unicode_view().has_value());
    EXPECT_EQ(TakeError().type, "TypeError");
}

// ============================================================================
// Containers
// ============================================================================

TEST(ContainerTests, BytesViewIsZeroCopy) {
    auto bytes = Bytes::from_data(std::string_view("abc\0def", 7));
    ASSERT_TRUE(bytes);
    EXPECT_EQ(bytes->size(), 7);
    auto view = bytes->view();
    EXPECT_EQ(reinterpret_cast<const char*>(view.data()), PyBytes_AS_STRING(bytes->ptr()));
    EXPECT_EQ(static_cast<char>(view[4]), 'd');

    auto object_view = bytes->object().bytes_view();
    ASSERT_TRUE(object_view);
    EXPECT_EQ(object_view->size(), 7u);
    bytes->release();
}

TEST(ContainerTests, CastChecksType) {
    auto wrong = Bytes::cast(to_object(5));
    EXPECT_FALSE(wrong);
    PendingError err = TakeError();
    EXPECT_EQ(err.type, "TypeError");
    EXPECT_EQ(err.message, "expected bytes");
}

TEST(ContainerTests, ListOperations) {
    auto list = List::create();
    ASSERT_TRUE(list);
    EXPECT_TRUE(list->append(1));
    EXPECT_TRUE(list->append(std::string("two")));
    EXPECT_TRUE(list->append(3.0));
    EXPECT_EQ(list->size(), 3);

    EXPECT_EQ(list->get(0).as<int>(), 1);
    EXPECT_EQ(list->get(1).as<std::string>(), "two");

    EXPECT_TRUE(list->set(0, 10));
    EXPECT_EQ(list->get(0).as<int>(), 10);

    Object out_of_range = list->get(99);
    EXPECT_FALSE(out_of_range.valid());
    EXPECT_EQ(TakeError().type, "IndexError");

    list->release();
}

TEST(ContainerTests, TupleFromValues) {
    auto tuple = Tuple::from_values(1, std::string("b"), 2.5, true);
    ASSERT_TRUE(tuple);
    EXPECT_EQ(tuple->size(), 4);
    EXPECT_EQ(tuple->get(0).as<int>(), 1);
    EXPECT_EQ(tuple->get(1).as<std::string>(), "b");
    EXPECT_DOUBLE_EQ(tuple->get(2).as<double>().value(), 2.5);
    EXPECT_EQ(tuple->get(3).as<bool>(), true);
    tuple->release();
}

TEST(ContainerTests, DictLookupAndSingleIteration) {
    auto dict = Dict::create();
    ASSERT_TRUE(dict);
    EXPECT_TRUE(dict->set_item("a", 1));
    EXPECT_TRUE(dict->set_item("b", 2));
    EXPECT_TRUE(dict->set_item("c", 3));
    EXPECT_EQ(dict->size(), 3);

    EXPECT_EQ(dict->get_item("b").as<int>(), 2);

    Object absent = dict->get_item("zzz");
    EXPECT_FALSE(absent.valid());
    EXPECT_FALSE(error_occurred());

    ScopedRef unhashable(EvalExpr("[1]"));
    EXPECT_FALSE(dict->get_item(*unhashable).valid());
    EXPECT_EQ(TakeError().type, "TypeError");

    DictIterator it = dict->iter();
    int64_t sum = 0;
    int count = 0;
    while (auto entry = it.next()) {
        EXPECT_FALSE(entry->key.is_owned());
        sum += entry->value.as<int64_t>().value();
        ++count;
    }
    EXPECT_EQ(count, 3);
    EXPECT_EQ(sum, 6);

    // Exhausted iterators stay exhausted
    EXPECT_TRUE(it.done());
    EXPECT_FALSE(it.next().has_value());

    DictIterator again = dict->iter();
    int second_pass = 0;
    while (again.next()) ++second_pass;
    EXPECT_EQ(second_pass, 3);

    dict->release();
}

TEST(ContainerTests, BufferViewOverBytearray) {
    ScopedRef builtins(ImportModule("builtins"));
    ScopedRef bytearray(builtins->get_attr("bytearray"));
    ScopedRef buf(bytearray->call(5));  // zero filled
    ASSERT_TRUE(buf);

    auto view = BufferView::get(*buf);
    ASSERT_TRUE(view);
    EXPECT_TRUE(view->held());
    EXPECT_EQ(view->size(), 5);
    EXPECT_EQ(static_cast<int>(view->data()[0]), 0);
    view->release();
    EXPECT_FALSE(view->held());
    EXPECT_TRUE(view->data().empty());
}

TEST(ContainerTests, LongClassification) {
    auto small = Long::cast(EvalExpr("-5"));
    ASSERT_TRUE(small);
    EXPECT_EQ(small->classify(), IntegerClass::Signed);
    EXPECT_EQ(small->as_signed(), -5);
    small->release();

    auto big = Long::cast(EvalExpr("2**64 - 1"));
    ASSERT_TRUE(big);
    EXPECT_EQ(big->classify(), IntegerClass::Unsigned);
    EXPECT_EQ(big->as_unsigned(), std::numeric_limits<uint64_t>::max());
    big->release();

    auto huge = Long::cast(EvalExpr("2**64"));
    ASSERT_TRUE(huge);
    EXPECT_EQ(huge->classify(), IntegerClass::Overflow);
    EXPECT_FALSE(error_occurred());
    EXPECT_EQ(huge->unsigned_mask(), 0u);
    huge->release();

    auto minus_one = Long::cast(EvalExpr("-1"));
    ASSERT_TRUE(minus_one);
    EXPECT_EQ(minus_one->unsigned_mask(), std::numeric_limits<uint64_t>::max());
    minus_one->release();
}

// ============================================================================
// Interpreter lock
// ============================================================================

TEST(LockTests, AllowThreadsReleasesAndReacquires) {
    EXPECT_EQ(PyGILState_Check(), 1);
    {
        AllowThreads unlocked;
        EXPECT_TRUE(unlocked.released());
        EXPECT_EQ(PyGILState_Check(), 0);
        unlocked.reacquire();
        EXPECT_FALSE(unlocked.released());
        EXPECT_EQ(PyGILState_Check(), 1);
    }
    {
        AllowThreads unlocked;
        EXPECT_EQ(PyGILState_Check(), 0);
    }
    EXPECT_EQ(PyGILState_Check(), 1);
}

TEST(LockTests, GilGuardIsReentrant) {
    GilGuard guard;
    EXPECT_EQ(PyGILState_Check(), 1);
}
