#include <set>
#include "DataTable.hpp"
#include "SelectionExceptions.hpp"

using namespace std;

DataTable::DataTable(const MatrixXd &data) : values(data)
{
}

DataTable::~DataTable()
{
}

int DataTable::rows() const
{
    return values.rows();
}

int DataTable::cols() const
{
    return values.cols();
}

const MatrixXd &DataTable::getValues() const
{
    return values;
}

// Copy the requested columns, in the requested order
MatrixXd DataTable::extractColumns(const std::vector<int> &column_indices) const
{
    MatrixXd subset(values.rows(), column_indices.size());

    for (size_t i = 0; i < column_indices.size(); ++i)
    {
        int col = column_indices[i];
        if (col < 0 || col >= values.cols())
        {
            throw InvalidDataException("column index " + to_string(col) + " out of range [0, " +
                                       to_string(values.cols()) + ")");
        }
        subset.col(i) = values.col(col);
    }

    return subset;
}

// Copy the requested rows; repeats are allowed (sampling with replacement)
MatrixXd DataTable::extractRows(const std::vector<int> &row_indices) const
{
    MatrixXd subset(row_indices.size(), values.cols());

    for (size_t i = 0; i < row_indices.size(); ++i)
    {
        int row = row_indices[i];
        if (row < 0 || row >= values.rows())
        {
            throw InvalidDataException("row index " + to_string(row) + " out of range [0, " +
                                       to_string(values.rows()) + ")");
        }
        subset.row(i) = values.row(row);
    }

    return subset;
}

MatrixTable::MatrixTable(const MatrixXd &data) : DataTable(data)
{
}

bool MatrixTable::hasColumnNames() const
{
    return false;
}

std::vector<std::string> MatrixTable::getColumnNames() const
{
    return std::vector<std::string>();
}

std::shared_ptr<const DataTable> MatrixTable::subsetColumns(const std::vector<int> &column_indices) const
{
    return std::make_shared<MatrixTable>(extractColumns(column_indices));
}

std::shared_ptr<const DataTable> MatrixTable::subsetRows(const std::vector<int> &row_indices) const
{
    return std::make_shared<MatrixTable>(extractRows(row_indices));
}

NamedTable::NamedTable(const MatrixXd &data, const std::vector<std::string> &names)
    : DataTable(data), column_names(names)
{
    if (static_cast<int>(names.size()) != data.cols())
    {
        throw InvalidDataException("expected " + to_string(data.cols()) + " column names, got " +
                                   to_string(names.size()));
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (!seen.insert(names[i]).second)
        {
            throw InvalidDataException("duplicate column name '" + names[i] + "'");
        }
    }
}

bool NamedTable::hasColumnNames() const
{
    return true;
}

std::vector<std::string> NamedTable::getColumnNames() const
{
    return column_names;
}

int NamedTable::columnIndex(const std::string &name) const
{
    for (size_t i = 0; i < column_names.size(); ++i)
    {
        if (column_names[i] == name)
        {
            return static_cast<int>(i);
        }
    }
    throw InvalidDataException("unknown column name '" + name + "'");
}

std::shared_ptr<const DataTable> NamedTable::subsetColumns(const std::vector<int> &column_indices) const
{
    MatrixXd subset = extractColumns(column_indices);

    std::vector<std::string> subset_names;
    subset_names.reserve(column_indices.size());
    for (size_t i = 0; i < column_indices.size(); ++i)
    {
        subset_names.push_back(column_names[column_indices[i]]);
    }

    return std::make_shared<NamedTable>(subset, subset_names);
}

std::shared_ptr<const DataTable> NamedTable::subsetColumns(const std::vector<std::string> &names) const
{
    std::vector<int> column_indices;
    column_indices.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i)
    {
        column_indices.push_back(columnIndex(names[i]));
    }
    return subsetColumns(column_indices);
}

std::shared_ptr<const DataTable> NamedTable::subsetRows(const std::vector<int> &row_indices) const
{
    return std::make_shared<NamedTable>(extractRows(row_indices), column_names);
}

DataPair::DataPair()
{
}

DataPair::DataPair(const std::shared_ptr<const DataTable> &input_table, const VectorXd &output_values)
    : inputs(input_table), outputs(output_values)
{
}

int DataPair::rows() const
{
    return inputs ? inputs->rows() : 0;
}
