#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "DataTable.hpp"
#include "DataVerification.hpp"
#include "SelectionExceptions.hpp"

namespace
{
    MatrixXd sampleMatrix()
    {
        MatrixXd X(3, 3);
        X << 1, 2, 3,
            4, 5, 6,
            7, 8, 9;
        return X;
    }
}

TEST(MatrixTableTest, SubsetColumnsKeepsRequestedOrder)
{
    MatrixTable table(sampleMatrix());
    std::vector<int> columns = {2, 0};
    std::shared_ptr<const DataTable> subset = table.subsetColumns(columns);

    ASSERT_EQ(subset->rows(), 3);
    ASSERT_EQ(subset->cols(), 2);
    EXPECT_DOUBLE_EQ(subset->getValues()(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(subset->getValues()(2, 1), 7.0);
    EXPECT_FALSE(subset->hasColumnNames());
    EXPECT_TRUE(subset->getColumnNames().empty());
}

TEST(MatrixTableTest, EmptyColumnSubsetKeepsRows)
{
    MatrixTable table(sampleMatrix());
    std::shared_ptr<const DataTable> subset = table.subsetColumns(std::vector<int>());

    EXPECT_EQ(subset->rows(), 3);
    EXPECT_EQ(subset->cols(), 0);
}

TEST(MatrixTableTest, OutOfRangeColumnThrows)
{
    MatrixTable table(sampleMatrix());
    std::vector<int> columns = {0, 3};
    EXPECT_THROW(table.subsetColumns(columns), InvalidDataException);
}

TEST(MatrixTableTest, SubsetRowsAllowsRepeats)
{
    MatrixTable table(sampleMatrix());
    std::vector<int> rows = {2, 2, 0};
    std::shared_ptr<const DataTable> subset = table.subsetRows(rows);

    ASSERT_EQ(subset->rows(), 3);
    EXPECT_DOUBLE_EQ(subset->getValues()(0, 0), 7.0);
    EXPECT_DOUBLE_EQ(subset->getValues()(1, 0), 7.0);
    EXPECT_DOUBLE_EQ(subset->getValues()(2, 2), 3.0);
}

TEST(NamedTableTest, SubsetByIndexCarriesNames)
{
    NamedTable table(sampleMatrix(), {"a", "b", "c"});
    std::vector<int> columns = {1, 2};
    std::shared_ptr<const DataTable> subset = table.subsetColumns(columns);

    ASSERT_TRUE(subset->hasColumnNames());
    std::vector<std::string> expected = {"b", "c"};
    EXPECT_EQ(subset->getColumnNames(), expected);
    EXPECT_DOUBLE_EQ(subset->getValues()(1, 0), 5.0);
}

TEST(NamedTableTest, SubsetByName)
{
    NamedTable table(sampleMatrix(), {"a", "b", "c"});
    std::vector<std::string> names = {"c", "a"};
    std::shared_ptr<const DataTable> subset = table.subsetColumns(names);

    std::vector<std::string> expected = {"c", "a"};
    EXPECT_EQ(subset->getColumnNames(), expected);
    EXPECT_DOUBLE_EQ(subset->getValues()(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(subset->getValues()(0, 1), 1.0);
}

TEST(NamedTableTest, RejectsBadNames)
{
    EXPECT_THROW(NamedTable(sampleMatrix(), {"a", "b"}), InvalidDataException);
    EXPECT_THROW(NamedTable(sampleMatrix(), {"a", "b", "a"}), InvalidDataException);

    NamedTable table(sampleMatrix(), {"a", "b", "c"});
    EXPECT_THROW(table.columnIndex("z"), InvalidDataException);
}

TEST(DataVerificationTest, AcceptsWellFormedPair)
{
    DataPair data(std::make_shared<MatrixTable>(sampleMatrix()), VectorXd::Zero(3));
    DataPair verified = verifyData(data);
    EXPECT_EQ(verified.rows(), 3);
}

TEST(DataVerificationTest, RejectsMalformedPairs)
{
    EXPECT_THROW(verifyData(DataPair()), InvalidDataException);

    DataPair mismatched(std::make_shared<MatrixTable>(sampleMatrix()), VectorXd::Zero(2));
    EXPECT_THROW(verifyData(mismatched), InvalidDataException);

    DataPair no_columns(std::make_shared<MatrixTable>(MatrixXd(3, 0)), VectorXd::Zero(3));
    EXPECT_THROW(verifyData(no_columns), InvalidDataException);

    MatrixXd with_nan = sampleMatrix();
    with_nan(1, 1) = std::numeric_limits<double>::quiet_NaN();
    DataPair nan_pair(std::make_shared<MatrixTable>(with_nan), VectorXd::Zero(3));
    EXPECT_THROW(verifyData(nan_pair), InvalidDataException);
}

TEST(DataVerificationTest, VariableNamesFromDataOrCaller)
{
    DataPair plain(std::make_shared<MatrixTable>(sampleMatrix()), VectorXd::Zero(3));
    std::vector<std::string> defaults = {"0", "1", "2"};
    EXPECT_EQ(determineVariableNames(plain, std::vector<std::string>()), defaults);

    DataPair named(std::make_shared<NamedTable>(sampleMatrix(), std::vector<std::string>{"x", "y", "z"}),
                   VectorXd::Zero(3));
    std::vector<std::string> from_columns = {"x", "y", "z"};
    EXPECT_EQ(determineVariableNames(named, std::vector<std::string>()), from_columns);

    std::vector<std::string> custom = {"p", "q", "r"};
    EXPECT_EQ(determineVariableNames(named, custom), custom);

    EXPECT_THROW(determineVariableNames(plain, std::vector<std::string>{"p", "q"}), InvalidDataException);
    EXPECT_THROW(determineVariableNames(plain, std::vector<std::string>{"p", "p", "q"}), InvalidDataException);
}
