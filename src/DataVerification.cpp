#include <set>
#include "DataVerification.hpp"
#include "SelectionExceptions.hpp"

using namespace std;

DataPair verifyData(const DataPair &data)
{
    if (!data.inputs)
    {
        throw InvalidDataException("inputs table is missing");
    }

    if (data.inputs->rows() == 0)
    {
        throw InvalidDataException("inputs must have at least one row");
    }

    if (data.inputs->cols() == 0)
    {
        throw InvalidDataException("inputs must have at least one column");
    }

    if (data.inputs->rows() != data.outputs.size())
    {
        throw InvalidDataException("inputs and outputs must have the same number of rows (" +
                                   to_string(data.inputs->rows()) + " vs " +
                                   to_string(data.outputs.size()) + ")");
    }

    if (!data.inputs->getValues().allFinite() || !data.outputs.allFinite())
    {
        throw InvalidDataException("data contains NaN or infinite values");
    }

    return data;
}

std::vector<std::string> determineVariableNames(const DataPair &data,
                                                const std::vector<std::string> &variable_names)
{
    if (!data.inputs)
    {
        throw InvalidDataException("inputs table is missing");
    }

    int n_columns = data.inputs->cols();

    if (variable_names.empty())
    {
        if (data.inputs->hasColumnNames())
        {
            return data.inputs->getColumnNames();
        }

        std::vector<std::string> defaults;
        defaults.reserve(n_columns);
        for (int i = 0; i < n_columns; ++i)
        {
            defaults.push_back(to_string(i));
        }
        return defaults;
    }

    if (static_cast<int>(variable_names.size()) != n_columns)
    {
        throw InvalidDataException("expected " + to_string(n_columns) + " variable names, got " +
                                   to_string(variable_names.size()));
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < variable_names.size(); ++i)
    {
        if (!seen.insert(variable_names[i]).second)
        {
            throw InvalidDataException("duplicate variable name '" + variable_names[i] + "'");
        }
    }

    return variable_names;
}
