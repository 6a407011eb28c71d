#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "PlateauExceptions.h"

enum class PartitionLabel { LEARN, VALIDATION, TEST };

const char* partitionLabelName(PartitionLabel label) noexcept;

class Dataset {
public:
    using Matrix = std::vector<std::vector<double>>;
    using ValueMap = std::unordered_map<std::string, double>;

    Dataset() = default;

    /**
     * @brief Creates an empty dataset with a fixed schema.
     * @pre Column names are non-empty and unique across inputs, outputs and string fields.
     * @throws Plateau::DatasetException on an invalid schema.
     */
    Dataset(std::vector<std::string> inputNames,
            std::vector<std::string> outputNames,
            std::vector<std::string> stringNames = {});

    /**
     * @brief Appends one row given in schema order.
     * @details An empty rowId is replaced with "row_<n>" (1-based).
     * @throws Plateau::DatasetException when sizes differ from the schema or the id is already used.
     */
    void addRow(std::string rowId,
                const std::vector<double>& inputs,
                const std::vector<double>& outputs,
                const std::vector<std::string>& strings = {});

    /**
     * @brief Appends one row given as name->value mappings.
     * @throws Plateau::DatasetException when a schema column is missing or an unknown column is present.
     */
    void addNamedRow(std::string rowId, const ValueMap& inputs, const ValueMap& outputs);

    size_t rowCount() const noexcept { return rowIds_.size(); }
    size_t inputCount() const noexcept { return inputNames_.size(); }
    size_t outputCount() const noexcept { return outputNames_.size(); }
    bool empty() const noexcept { return rowIds_.empty(); }

    const std::vector<std::string>& inputNames() const noexcept { return inputNames_; }
    const std::vector<std::string>& outputNames() const noexcept { return outputNames_; }
    const std::vector<std::string>& stringNames() const noexcept { return stringNames_; }
    const std::vector<std::string>& rowIds() const noexcept { return rowIds_; }
    const std::string& rowId(size_t row) const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findInputIndex(const std::string& name) const;
    int findOutputIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const;

    const std::vector<double>& inputColumn(const std::string& name) const;
    const std::vector<double>& outputColumn(const std::string& name) const;
    const std::vector<std::string>& stringColumn(const std::string& name) const;

    /**
     * @brief Values of an input or output column, looked up by name.
     * @throws Plateau::DatasetException when the column is unknown.
     */
    const std::vector<double>& numericColumn(const std::string& name) const;

    double inputValue(size_t row, const std::string& column) const;
    double outputValue(size_t row, const std::string& column) const;

    // Row-major views in the order predictors consume them.
    Matrix inputMatrix() const;
    Matrix inputMatrix(const std::vector<std::string>& columns) const;
    Matrix outputMatrix() const;

    /**
     * @brief Copies the given rows (in the given order) into a new dataset with the same schema.
     * @details Attached labels are carried over for the selected rows.
     * @throws Plateau::DatasetException on out-of-range or repeated row indices.
     */
    Dataset subset(const std::vector<size_t>& rows) const;

    /**
     * @brief Keeps only the named input columns, in the given order. Outputs are untouched.
     */
    Dataset withInputs(const std::vector<std::string>& columns) const;

    /**
     * @brief Returns a copy whose numeric values were passed through fn(column, value).
     */
    Dataset transformed(const std::function<double(const std::string&, double)>& fn) const;

    /**
     * @brief Attaches one partition label per row.
     * @throws Plateau::DatasetException when labels.size() != rowCount().
     */
    void attachLabels(std::vector<PartitionLabel> labels);
    bool hasLabels() const noexcept { return !labels_.empty(); }
    const std::vector<PartitionLabel>& labels() const noexcept { return labels_; }

private:
    std::vector<std::string> inputNames_;
    std::vector<std::string> outputNames_;
    std::vector<std::string> stringNames_;
    std::unordered_map<std::string, size_t> inputIndex_;
    std::unordered_map<std::string, size_t> outputIndex_;
    std::unordered_map<std::string, size_t> stringIndex_;

    // Column-major storage
    std::vector<std::vector<double>> inputs_;
    std::vector<std::vector<double>> outputs_;
    std::vector<std::vector<std::string>> strings_;

    std::vector<std::string> rowIds_;
    std::unordered_set<std::string> rowIdSet_;
    std::vector<PartitionLabel> labels_;

    void checkRow(size_t row) const;
};
