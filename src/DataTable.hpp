#ifndef DATA_TABLE_HPP
#define DATA_TABLE_HPP

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

using namespace Eigen;

// Read-only 2-D numeric table. Subsetting always returns a new table of the
// same concrete kind.
class DataTable
{
protected:
    MatrixXd values;

    MatrixXd extractColumns(const std::vector<int> &column_indices) const;
    MatrixXd extractRows(const std::vector<int> &row_indices) const;

public:
    explicit DataTable(const MatrixXd &data);
    virtual ~DataTable();

    int rows() const;
    int cols() const;
    const MatrixXd &getValues() const;

    virtual bool hasColumnNames() const = 0;
    virtual std::vector<std::string> getColumnNames() const = 0;

    virtual std::shared_ptr<const DataTable> subsetColumns(const std::vector<int> &column_indices) const = 0;
    virtual std::shared_ptr<const DataTable> subsetRows(const std::vector<int> &row_indices) const = 0;
};

// Plain indexable array; columns are addressed by position only
class MatrixTable : public DataTable
{
public:
    explicit MatrixTable(const MatrixXd &data);

    bool hasColumnNames() const;
    std::vector<std::string> getColumnNames() const;

    std::shared_ptr<const DataTable> subsetColumns(const std::vector<int> &column_indices) const;
    std::shared_ptr<const DataTable> subsetRows(const std::vector<int> &row_indices) const;
};

// Tabular data with one unique name per column
class NamedTable : public DataTable
{
private:
    std::vector<std::string> column_names;

public:
    NamedTable(const MatrixXd &data, const std::vector<std::string> &names);

    bool hasColumnNames() const;
    std::vector<std::string> getColumnNames() const;
    int columnIndex(const std::string &name) const;

    std::shared_ptr<const DataTable> subsetColumns(const std::vector<int> &column_indices) const;
    std::shared_ptr<const DataTable> subsetColumns(const std::vector<std::string> &names) const;
    std::shared_ptr<const DataTable> subsetRows(const std::vector<int> &row_indices) const;
};

// (inputs, outputs) with one output per input row
struct DataPair
{
    std::shared_ptr<const DataTable> inputs;
    VectorXd outputs;

    DataPair();
    DataPair(const std::shared_ptr<const DataTable> &input_table, const VectorXd &output_values);

    int rows() const;
};

#endif // DATA_TABLE_HPP
