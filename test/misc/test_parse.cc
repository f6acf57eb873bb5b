#include "LinCalc.hh"
#include "lc_parse.hh"
#include "lc_util.hh"

#include <gtest/gtest.h>


class TestParse : public ::testing::Test
{
    protected:

    virtual void SetUp() {};

    virtual void TearDown() {};

    template <typename T>
    struct ParseTestData {
        LinCalc::MatrixParser<T> Parser;
        LinCalc::DenseMatrix<T> M;

        ParseTestData() :
        Parser(false),
        M()
        {}
    };

    template <typename T>
    static void expect_rows(
        const LinCalc::DenseMatrix<T> &M,
        const std::vector<std::vector<T>> &rows
    ) {
        ASSERT_EQ(M.n_rows, (int64_t) rows.size());
        for (int64_t i = 0; i < M.n_rows; ++i) {
            ASSERT_EQ(M.n_cols, (int64_t) rows[i].size());
            for (int64_t j = 0; j < M.n_cols; ++j)
                EXPECT_DOUBLE_EQ(M(i, j), rows[i][j]);
        }
    }

    /// Parses every text in `forms` and checks that all of them give the same matrix.
    template <typename T>
    static void test_equivalent_forms(
        ParseTestData<T> &all_data,
        const std::vector<std::string> &forms
    ) {
        LinCalc::DenseMatrix<T> first;
        ASSERT_EQ(all_data.Parser.call(forms[0], LinCalc::Arity::Matrix, first), LinCalc::Ok) << forms[0];
        for (size_t k = 1; k < forms.size(); ++k) {
            LinCalc::DenseMatrix<T> other;
            ASSERT_EQ(all_data.Parser.call(forms[k], LinCalc::Arity::Matrix, other), LinCalc::Ok) << forms[k];
            EXPECT_TRUE(first.same_shape(other)) << forms[k];
            EXPECT_EQ(first.A, other.A) << forms[k];
        }
    }
};

TEST_F(TestParse, bracketed_list) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("[[1,2,3],[4,5,6]]", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    expect_rows<double>(all_data.M, {{1, 2, 3}, {4, 5, 6}});
}

TEST_F(TestParse, semicolon_rows) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("1 2; 3 4", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    expect_rows<double>(all_data.M, {{1, 2}, {3, 4}});
}

TEST_F(TestParse, newline_rows) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("1,2,3\n4,5,6", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    expect_rows<double>(all_data.M, {{1, 2, 3}, {4, 5, 6}});
}

TEST_F(TestParse, notations_agree) {
    ParseTestData<double> all_data;
    test_equivalent_forms(all_data, {
        "[[1,2,3],[4,5,6]]",
        "[[1, 2, 3], [4, 5, 6]]",
        "[[1 2 3] [4 5 6]]",
        "[1 2 3; 4 5 6]",
        "[1,2,3],[4,5,6]",
        "[1 2 3] [4 5 6]",
        "1 2 3; 4 5 6",
        "1,2,3;4,5,6;",
        "1,2,3\n4,5,6",
        "  1  2  3 \r\n\n 4,5 , 6 \n",
        "1 2 3\n4 5 6;"
    });
}

TEST_F(TestParse, reals_and_signs) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("-1.5 +2 3e-1; .25 -0 1E2", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    expect_rows<double>(all_data.M, {{-1.5, 2, 0.3}, {0.25, 0, 100}});
}

TEST_F(TestParse, flat_list_is_one_row) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("[1, 2, 3]", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    expect_rows<double>(all_data.M, {{1, 2, 3}});
}

TEST_F(TestParse, ragged_rows) {
    ParseTestData<double> all_data;
    int err = all_data.Parser.call("1 2\n3", LinCalc::Arity::Matrix, all_data.M);
    ASSERT_EQ(err, LinCalc::RaggedRows);
    EXPECT_EQ(all_data.Parser.error.kind, LinCalc::RaggedRows);
    EXPECT_EQ(all_data.Parser.error.row, 2);
    EXPECT_EQ(all_data.Parser.error.expected, 2);
    EXPECT_EQ(all_data.Parser.error.actual, 1);
    EXPECT_EQ(all_data.Parser.error.message, "row 2 has 1 entries, expected 2");
}

TEST_F(TestParse, ragged_bracketed_rows) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("[[1,2],[3,4],[5]]", LinCalc::Arity::Matrix, all_data.M), LinCalc::RaggedRows);
    EXPECT_EQ(all_data.Parser.error.row, 3);
    EXPECT_EQ(all_data.Parser.error.actual, 1);
}

TEST_F(TestParse, empty_input) {
    ParseTestData<double> all_data;
    EXPECT_EQ(all_data.Parser.call("", LinCalc::Arity::Matrix, all_data.M), LinCalc::EmptyInput);
    EXPECT_EQ(all_data.Parser.call("   \n\t ", LinCalc::Arity::Matrix, all_data.M), LinCalc::EmptyInput);
    EXPECT_EQ(all_data.Parser.call(" ; ;\n", LinCalc::Arity::Matrix, all_data.M), LinCalc::EmptyInput);
    EXPECT_EQ(all_data.Parser.call("[]", LinCalc::Arity::Matrix, all_data.M), LinCalc::EmptyInput);
    EXPECT_EQ(all_data.Parser.call("[[]]", LinCalc::Arity::Matrix, all_data.M), LinCalc::EmptyInput);
    EXPECT_EQ(all_data.Parser.error.message, "empty matrix: no rows to read");
}

TEST_F(TestParse, malformed_token) {
    ParseTestData<double> all_data;
    int err = all_data.Parser.call("1 a\n2 3", LinCalc::Arity::Matrix, all_data.M);
    ASSERT_EQ(err, LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.error.token, "a");
    EXPECT_EQ(all_data.Parser.error.row, 1);
    EXPECT_EQ(all_data.Parser.error.col, 2);
    EXPECT_EQ(all_data.Parser.error.message, "row 1, column 2: \"a\" is not a real number");
}

TEST_F(TestParse, rejects_partial_numbers_and_specials) {
    ParseTestData<double> all_data;
    EXPECT_EQ(all_data.Parser.call("1 2.5x", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.error.token, "2.5x");
    EXPECT_EQ(all_data.Parser.call("nan 1", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.call("1 inf", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.call("1 1e999", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
}

TEST_F(TestParse, rejects_hexadecimal) {
    ParseTestData<double> all_data;
    EXPECT_EQ(all_data.Parser.call("0x10", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.error.token, "0x10");
    EXPECT_EQ(all_data.Parser.call("1 0x1p3", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.error.col, 2);
    EXPECT_EQ(all_data.Parser.call("[[0X1A]]", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
}

TEST_F(TestParse, single_precision_range) {
    ParseTestData<float> all_data;
    EXPECT_EQ(all_data.Parser.call("1 1e39", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.error.token, "1e39");
    EXPECT_EQ(all_data.Parser.call("-1e39", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    ASSERT_EQ(all_data.Parser.call("3e38 -3e38", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    EXPECT_FLOAT_EQ(all_data.M(0, 0), 3e38f);
}

TEST_F(TestParse, rows_without_outer_brackets) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("[1,2],[3,4]", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    expect_rows<double>(all_data.M, {{1, 2}, {3, 4}});
    ASSERT_EQ(all_data.Parser.call(" [1, 2, 3]; [4, 5, 6]", LinCalc::Arity::VectorList, all_data.M), LinCalc::Ok);
    expect_rows<double>(all_data.M, {{1, 4}, {2, 5}, {3, 6}});
    EXPECT_EQ(all_data.Parser.call("[1,2],[3]", LinCalc::Arity::Matrix, all_data.M), LinCalc::RaggedRows);
    EXPECT_EQ(all_data.Parser.call("[1,2] 5", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
}

TEST_F(TestParse, malformed_brackets) {
    ParseTestData<double> all_data;
    EXPECT_EQ(all_data.Parser.call("[[1,2],[3,4]", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.call("[[1,2],[3,4]] 5", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.call("[[1,2],[3,[4]]]", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.call("[[1;2],[3,4]]", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
    EXPECT_EQ(all_data.Parser.call("[1, 2", LinCalc::Arity::Matrix, all_data.M), LinCalc::MalformedToken);
}

TEST_F(TestParse, failure_leaves_output_untouched) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("1 2; 3 4", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    ASSERT_EQ(all_data.Parser.call("1 2; 3", LinCalc::Arity::Matrix, all_data.M), LinCalc::RaggedRows);
    expect_rows<double>(all_data.M, {{1, 2}, {3, 4}});
}

TEST_F(TestParse, vectors_become_columns) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("1 2 3; 4 5 6", LinCalc::Arity::VectorList, all_data.M), LinCalc::Ok);
    expect_rows<double>(all_data.M, {{1, 4}, {2, 5}, {3, 6}});
}

TEST_F(TestParse, vector_dimension_mismatch) {
    ParseTestData<double> all_data;
    ASSERT_EQ(all_data.Parser.call("[[1,2,3],[4,5]]", LinCalc::Arity::VectorList, all_data.M), LinCalc::RaggedRows);
    EXPECT_EQ(all_data.Parser.error.message, "vector 2 has dimension 2, expected 3");
    ASSERT_EQ(all_data.Parser.call("", LinCalc::Arity::VectorList, all_data.M), LinCalc::EmptyInput);
    EXPECT_EQ(all_data.Parser.error.message, "empty input: no vectors to read");
}

TEST_F(TestParse, single_precision) {
    ParseTestData<float> all_data;
    ASSERT_EQ(all_data.Parser.call("0.5 1; 2 4", LinCalc::Arity::Matrix, all_data.M), LinCalc::Ok);
    expect_rows<float>(all_data.M, {{0.5f, 1.0f}, {2.0f, 4.0f}});
}
