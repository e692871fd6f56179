#include "table.h"
#include "value.h"
#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace {

std::string text(Value v) {
    char* s = value_to_cstring(v);
    std::string r(s);
    free(s);
    return r;
}

/* Applies `op` and returns the textual result, or "fault: <message>". */
std::string apply(BinaryOp op, Value a, Value b) {
    Value out;
    char err[128];
    if (!value_binary(op, a, b, &out, err, sizeof(err))) return std::string("fault: ") + err;
    std::string r = std::string(value_type_name(out)) + ":" + text(out);
    value_decref(out);
    return r;
}

class Str {
public:
    explicit Str(const char* s) : v_(value_cstring(s)) {}
    ~Str() { value_decref(v_); }
    operator Value() const { return v_; }
    Value value() const { return v_; }
private:
    Value v_;
};

}  // namespace

TEST(ValueTest, Formatting) {
    EXPECT_EQ("42", text(INT_VAL(42)));
    EXPECT_EQ("-7", text(INT_VAL(-7)));
    EXPECT_EQ("2.5", text(FLOAT_VAL(2.5)));
    EXPECT_EQ("3.0", text(FLOAT_VAL(3.0)));
    EXPECT_EQ("true", text(BOOL_VAL(true)));
    EXPECT_EQ("false", text(BOOL_VAL(false)));
    Str s("hello");
    EXPECT_EQ("hello", text(s));
}

TEST(ValueTest, Truthiness) {
    EXPECT_TRUE(value_truthy(INT_VAL(1)));
    EXPECT_FALSE(value_truthy(INT_VAL(0)));
    EXPECT_FALSE(value_truthy(FLOAT_VAL(0.0)));
    EXPECT_TRUE(value_truthy(BOOL_VAL(true)));
    Str empty("");
    Str zero("0");
    EXPECT_FALSE(value_truthy(empty));
    EXPECT_TRUE(value_truthy(zero));
}

TEST(ValueTest, IntegerArithmetic) {
    EXPECT_EQ("int:5", apply(BIN_ADD, INT_VAL(2), INT_VAL(3)));
    EXPECT_EQ("int:-1", apply(BIN_SUB, INT_VAL(2), INT_VAL(3)));
    EXPECT_EQ("int:6", apply(BIN_MUL, INT_VAL(2), INT_VAL(3)));
    EXPECT_EQ("int:3", apply(BIN_DIV, INT_VAL(7), INT_VAL(2)));
    EXPECT_EQ("int:1", apply(BIN_MOD, INT_VAL(7), INT_VAL(2)));
}

TEST(ValueTest, MixedArithmeticPromotesToFloat) {
    EXPECT_EQ("float:3.5", apply(BIN_ADD, INT_VAL(1), FLOAT_VAL(2.5)));
    EXPECT_EQ("float:0.5", apply(BIN_DIV, FLOAT_VAL(1.0), INT_VAL(2)));
}

TEST(ValueTest, IntegerOverflowWraps) {
    EXPECT_EQ("int:-9223372036854775808", apply(BIN_ADD, INT_VAL(INT64_MAX), INT_VAL(1)));
    EXPECT_EQ("int:-9223372036854775808", apply(BIN_DIV, INT_VAL(INT64_MIN), INT_VAL(-1)));
    EXPECT_EQ("int:0", apply(BIN_MOD, INT_VAL(INT64_MIN), INT_VAL(-1)));
}

TEST(ValueTest, DivisionByZeroFaults) {
    EXPECT_EQ("fault: division by zero", apply(BIN_DIV, INT_VAL(1), INT_VAL(0)));
    EXPECT_EQ("fault: modulo by zero", apply(BIN_MOD, INT_VAL(1), INT_VAL(0)));
}

TEST(ValueTest, PlusConcatenatesUnlessBothNumeric) {
    Str a("a");
    Str two("2");
    EXPECT_EQ("string:a1", apply(BIN_ADD, a, INT_VAL(1)));
    EXPECT_EQ("int:4", apply(BIN_ADD, two, two));
    EXPECT_EQ("int:42", apply(BIN_ADD, Str("41"), INT_VAL(1)));
    EXPECT_EQ("string:2a", apply(BIN_ADD, two, a));
    EXPECT_EQ("string:true!", apply(BIN_ADD, BOOL_VAL(true), Str("!")));
}

TEST(ValueTest, OtherArithmeticParsesNumericStrings) {
    Str ten("10");
    Str half(" 0.5 ");
    EXPECT_EQ("int:7", apply(BIN_SUB, ten, INT_VAL(3)));
    EXPECT_EQ("float:5.0", apply(BIN_MUL, ten, half));
}

TEST(ValueTest, NonNumericArithmeticFaults) {
    Str word("abc");
    EXPECT_EQ("fault: operands of '-' must be numbers (got string and int)",
              apply(BIN_SUB, word, INT_VAL(1)));
    EXPECT_EQ("fault: operands of '*' must be numbers (got bool and int)",
              apply(BIN_MUL, BOOL_VAL(true), INT_VAL(1)));
}

TEST(ValueTest, EqualityAcrossTypes) {
    Str three("3");
    Str abc("abc");
    EXPECT_EQ("bool:true", apply(BIN_EQ, three, INT_VAL(3)));
    EXPECT_EQ("bool:true", apply(BIN_EQ, INT_VAL(3), FLOAT_VAL(3.0)));
    EXPECT_EQ("bool:false", apply(BIN_EQ, abc, INT_VAL(3)));
    EXPECT_EQ("bool:true", apply(BIN_NEQ, abc, Str("abd")));
    EXPECT_EQ("bool:true", apply(BIN_EQ, BOOL_VAL(true), BOOL_VAL(true)));
    EXPECT_EQ("bool:true", apply(BIN_EQ, Str("true"), BOOL_VAL(true)));
}

TEST(ValueTest, Ordering) {
    Str ten("10");
    Str nine("9");
    EXPECT_EQ("bool:true", apply(BIN_LT, INT_VAL(2), INT_VAL(10)));
    EXPECT_EQ("bool:true", apply(BIN_GT, ten, nine));            /* numeric, not lexical */
    EXPECT_EQ("bool:true", apply(BIN_LT, Str("apple"), Str("banana")));
    EXPECT_EQ("bool:true", apply(BIN_LTE, INT_VAL(3), INT_VAL(3)));
    EXPECT_EQ("bool:false", apply(BIN_GTE, FLOAT_VAL(2.5), INT_VAL(3)));
}

TEST(ValueTest, Negate) {
    Value out;
    char err[128];
    ASSERT_TRUE(value_negate(INT_VAL(4), &out, err, sizeof(err)));
    EXPECT_EQ("-4", text(out));
    Str s("2.5");
    ASSERT_TRUE(value_negate(s, &out, err, sizeof(err)));
    EXPECT_EQ("-2.5", text(out));
    Str word("x");
    EXPECT_FALSE(value_negate(word, &out, err, sizeof(err)));
    EXPECT_STREQ("operand of '-' must be a number (got string)", err);
}

TEST(ValueTest, ExitCodeConversion) {
    int code = -1;
    char err[128];
    EXPECT_TRUE(value_to_exit_code(INT_VAL(3), &code, err, sizeof(err)));
    EXPECT_EQ(3, code);
    EXPECT_TRUE(value_to_exit_code(BOOL_VAL(false), &code, err, sizeof(err)));
    EXPECT_EQ(1, code);
    EXPECT_TRUE(value_to_exit_code(BOOL_VAL(true), &code, err, sizeof(err)));
    EXPECT_EQ(0, code);
    Str seven("7");
    EXPECT_TRUE(value_to_exit_code(seven, &code, err, sizeof(err)));
    EXPECT_EQ(7, code);
    Str word("nope");
    EXPECT_FALSE(value_to_exit_code(word, &code, err, sizeof(err)));
    EXPECT_STREQ("cannot return 'nope' as an exit code", err);
}

TEST(ValueTest, ExitCodeMustFitAnInt) {
    int code = -1;
    char err[128];
    EXPECT_TRUE(value_to_exit_code(INT_VAL(INT32_MIN), &code, err, sizeof(err)));
    EXPECT_EQ(INT32_MIN, code);
    EXPECT_FALSE(value_to_exit_code(INT_VAL(4294967296LL), &code, err, sizeof(err)));
    EXPECT_STREQ("exit code '4294967296' out of range", err);
    EXPECT_FALSE(value_to_exit_code(FLOAT_VAL(1e20), &code, err, sizeof(err)));
    EXPECT_FALSE(value_to_exit_code(FLOAT_VAL(NAN), &code, err, sizeof(err)));
    Str big("-3000000000");
    EXPECT_FALSE(value_to_exit_code(big, &code, err, sizeof(err)));
}

TEST(ValueTest, EqualityRequiresSameType) {
    Str one("1");
    EXPECT_FALSE(value_equal(one, INT_VAL(1)));
    EXPECT_TRUE(value_equal(INT_VAL(1), INT_VAL(1)));
    Str other("1");
    EXPECT_TRUE(value_equal(one, other));
}

TEST(ValueTest, CloneSharesNothing) {
    Str original("data");
    Value copy = value_clone(original);
    EXPECT_NE(AS_OBJ(original.value()), AS_OBJ(copy));
    EXPECT_TRUE(value_equal(original, copy));
    EXPECT_EQ(1, AS_OBJ(copy)->refcount);
    value_decref(copy);
}

TEST(TableTest, SetGetDelete) {
    Table t;
    table_init(&t);
    EXPECT_TRUE(table_set_cstr(&t, "a", INT_VAL(1)));
    EXPECT_FALSE(table_set_cstr(&t, "a", INT_VAL(2)));   /* existing key */
    Value v;
    ASSERT_TRUE(table_get_cstr(&t, "a", &v));
    EXPECT_EQ(2, AS_INT(v));
    EXPECT_FALSE(table_get_cstr(&t, "b", &v));
    EXPECT_TRUE(table_delete_cstr(&t, "a"));
    EXPECT_FALSE(table_get_cstr(&t, "a", &v));
    EXPECT_EQ(0, table_size(&t));
    table_free(&t);
}

TEST(TableTest, GrowsAndKeepsEverything) {
    Table t;
    table_init(&t);
    for (int i = 0; i < 500; i++) {
        std::string key = "k" + std::to_string(i);
        table_set_cstr(&t, key.c_str(), INT_VAL(i));
    }
    for (int i = 0; i < 500; i += 2) {
        std::string key = "k" + std::to_string(i);
        table_delete_cstr(&t, key.c_str());
    }
    EXPECT_EQ(250, table_size(&t));
    for (int i = 1; i < 500; i += 2) {
        std::string key = "k" + std::to_string(i);
        Value v;
        ASSERT_TRUE(table_get_cstr(&t, key.c_str(), &v)) << key;
        EXPECT_EQ(i, AS_INT(v));
    }
    table_free(&t);
}

TEST(TableTest, SortedKeys) {
    Table t;
    table_init(&t);
    table_set_cstr(&t, "beta", INT_VAL(1));
    table_set_cstr(&t, "alpha", INT_VAL(2));
    table_set_cstr(&t, "Zed", INT_VAL(3));
    int count = 0;
    ObjString** keys = table_sorted_keys(&t, &count);
    ASSERT_EQ(3, count);
    EXPECT_STREQ("Zed", keys[0]->chars);
    EXPECT_STREQ("alpha", keys[1]->chars);
    EXPECT_STREQ("beta", keys[2]->chars);
    free(keys);
    table_free(&t);
}

TEST(TableTest, CloneIsIndependent) {
    Table a, b;
    table_init(&a);
    Value s = value_cstring("shared");
    table_set_cstr(&a, "x", s);
    value_decref(s);
    table_clone(&a, &b);
    table_set_cstr(&a, "x", INT_VAL(1));
    Value v;
    ASSERT_TRUE(table_get_cstr(&b, "x", &v));
    ASSERT_TRUE(IS_STRING(v));
    EXPECT_STREQ("shared", AS_CSTRING(v));
    table_free(&a);
    table_free(&b);
}
