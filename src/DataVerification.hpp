#ifndef DATA_VERIFICATION_HPP
#define DATA_VERIFICATION_HPP

#include <string>
#include <vector>
#include "DataTable.hpp"

// Checks shape and content of a data pair; returns it unchanged when valid
DataPair verifyData(const DataPair &data);

// Caller-supplied names win; otherwise column names, otherwise "0", "1", ...
std::vector<std::string> determineVariableNames(const DataPair &data,
                                                const std::vector<std::string> &variable_names);

#endif // DATA_VERIFICATION_HPP
