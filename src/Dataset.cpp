#include "Dataset.h"

#include <algorithm>
#include <utility>

namespace {
void registerNames(const std::vector<std::string>& names,
                   const char* role,
                   std::unordered_map<std::string, size_t>& index,
                   std::unordered_set<std::string>& seen) {
    for (size_t i = 0; i < names.size(); ++i) {
        const std::string& name = names[i];
        if (name.empty()) {
            throw Plateau::DatasetException(std::string("empty ") + role + " column name at position " + std::to_string(i));
        }
        if (!seen.insert(name).second) {
            throw Plateau::DatasetException("duplicate column name: " + name);
        }
        index.emplace(name, i);
    }
}

int lookup(const std::unordered_map<std::string, size_t>& index, const std::string& name) {
    auto it = index.find(name);
    if (it == index.end()) return -1;
    return static_cast<int>(it->second);
}
} // namespace

const char* partitionLabelName(PartitionLabel label) noexcept {
    switch (label) {
        case PartitionLabel::LEARN: return "learn";
        case PartitionLabel::VALIDATION: return "validation";
        case PartitionLabel::TEST: return "test";
    }
    return "unknown";
}

Dataset::Dataset(std::vector<std::string> inputNames,
                 std::vector<std::string> outputNames,
                 std::vector<std::string> stringNames)
    : inputNames_(std::move(inputNames)),
      outputNames_(std::move(outputNames)),
      stringNames_(std::move(stringNames)) {
    std::unordered_set<std::string> seen;
    registerNames(inputNames_, "input", inputIndex_, seen);
    registerNames(outputNames_, "output", outputIndex_, seen);
    registerNames(stringNames_, "string", stringIndex_, seen);

    inputs_.assign(inputNames_.size(), {});
    outputs_.assign(outputNames_.size(), {});
    strings_.assign(stringNames_.size(), {});
}

void Dataset::addRow(std::string rowId,
                     const std::vector<double>& inputs,
                     const std::vector<double>& outputs,
                     const std::vector<std::string>& strings) {
    if (!labels_.empty()) {
        throw Plateau::DatasetException("rows cannot be added after partition labels are attached");
    }
    if (inputs.size() != inputNames_.size() || outputs.size() != outputNames_.size()) {
        throw Plateau::DatasetException("row has " + std::to_string(inputs.size()) + " inputs / " +
                                        std::to_string(outputs.size()) + " outputs, schema expects " +
                                        std::to_string(inputNames_.size()) + " / " + std::to_string(outputNames_.size()));
    }
    if (!strings.empty() && strings.size() != stringNames_.size()) {
        throw Plateau::DatasetException("row has " + std::to_string(strings.size()) + " string fields, schema expects " +
                                        std::to_string(stringNames_.size()));
    }

    if (rowId.empty()) rowId = "row_" + std::to_string(rowIds_.size() + 1);
    if (!rowIdSet_.insert(rowId).second) {
        throw Plateau::DatasetException("duplicate row id: " + rowId);
    }
    rowIds_.push_back(std::move(rowId));

    for (size_t j = 0; j < inputs.size(); ++j) inputs_[j].push_back(inputs[j]);
    for (size_t j = 0; j < outputs.size(); ++j) outputs_[j].push_back(outputs[j]);
    for (size_t j = 0; j < stringNames_.size(); ++j) {
        strings_[j].push_back(strings.empty() ? std::string() : strings[j]);
    }
}

void Dataset::addNamedRow(std::string rowId, const ValueMap& inputs, const ValueMap& outputs) {
    auto ordered = [](const std::vector<std::string>& names, const ValueMap& values, const char* role) {
        if (values.size() != names.size()) {
            throw Plateau::DatasetException(std::string("row provides ") + std::to_string(values.size()) + " " + role +
                                            " values, schema expects " + std::to_string(names.size()));
        }
        std::vector<double> out;
        out.reserve(names.size());
        for (const auto& name : names) {
            auto it = values.find(name);
            if (it == values.end()) {
                throw Plateau::DatasetException(std::string("row is missing ") + role + " column: " + name);
            }
            out.push_back(it->second);
        }
        return out;
    };
    addRow(std::move(rowId), ordered(inputNames_, inputs, "input"), ordered(outputNames_, outputs, "output"));
}

const std::string& Dataset::rowId(size_t row) const {
    checkRow(row);
    return rowIds_[row];
}

int Dataset::findInputIndex(const std::string& name) const { return lookup(inputIndex_, name); }
int Dataset::findOutputIndex(const std::string& name) const { return lookup(outputIndex_, name); }

bool Dataset::hasColumn(const std::string& name) const {
    return inputIndex_.count(name) > 0 || outputIndex_.count(name) > 0 || stringIndex_.count(name) > 0;
}

const std::vector<double>& Dataset::inputColumn(const std::string& name) const {
    const int idx = findInputIndex(name);
    if (idx < 0) throw Plateau::DatasetException("unknown input column: " + name);
    return inputs_[static_cast<size_t>(idx)];
}

const std::vector<double>& Dataset::outputColumn(const std::string& name) const {
    const int idx = findOutputIndex(name);
    if (idx < 0) throw Plateau::DatasetException("unknown output column: " + name);
    return outputs_[static_cast<size_t>(idx)];
}

const std::vector<std::string>& Dataset::stringColumn(const std::string& name) const {
    auto it = stringIndex_.find(name);
    if (it == stringIndex_.end()) throw Plateau::DatasetException("unknown string column: " + name);
    return strings_[it->second];
}

const std::vector<double>& Dataset::numericColumn(const std::string& name) const {
    const int in = findInputIndex(name);
    if (in >= 0) return inputs_[static_cast<size_t>(in)];
    const int out = findOutputIndex(name);
    if (out >= 0) return outputs_[static_cast<size_t>(out)];
    throw Plateau::DatasetException("unknown numeric column: " + name);
}

double Dataset::inputValue(size_t row, const std::string& column) const {
    checkRow(row);
    return inputColumn(column)[row];
}

double Dataset::outputValue(size_t row, const std::string& column) const {
    checkRow(row);
    return outputColumn(column)[row];
}

Dataset::Matrix Dataset::inputMatrix() const {
    return inputMatrix(inputNames_);
}

Dataset::Matrix Dataset::inputMatrix(const std::vector<std::string>& columns) const {
    std::vector<const std::vector<double>*> sources;
    sources.reserve(columns.size());
    for (const auto& name : columns) sources.push_back(&inputColumn(name));

    Matrix out(rowCount(), std::vector<double>(columns.size(), 0.0));
    for (size_t j = 0; j < sources.size(); ++j) {
        const auto& col = *sources[j];
        for (size_t i = 0; i < out.size(); ++i) out[i][j] = col[i];
    }
    return out;
}

Dataset::Matrix Dataset::outputMatrix() const {
    Matrix out(rowCount(), std::vector<double>(outputNames_.size(), 0.0));
    for (size_t j = 0; j < outputs_.size(); ++j) {
        for (size_t i = 0; i < out.size(); ++i) out[i][j] = outputs_[j][i];
    }
    return out;
}

Dataset Dataset::subset(const std::vector<size_t>& rows) const {
    Dataset out(inputNames_, outputNames_, stringNames_);
    std::vector<double> in(inputNames_.size());
    std::vector<double> outVals(outputNames_.size());
    std::vector<std::string> str(stringNames_.size());
    std::vector<PartitionLabel> carried;
    if (!labels_.empty()) carried.reserve(rows.size());

    for (size_t row : rows) {
        checkRow(row);
        for (size_t j = 0; j < in.size(); ++j) in[j] = inputs_[j][row];
        for (size_t j = 0; j < outVals.size(); ++j) outVals[j] = outputs_[j][row];
        for (size_t j = 0; j < str.size(); ++j) str[j] = strings_[j][row];
        // addRow rejects a repeated id, which also rejects a repeated index
        out.addRow(rowIds_[row], in, outVals, str);
        if (!labels_.empty()) carried.push_back(labels_[row]);
    }
    if (!carried.empty()) out.attachLabels(std::move(carried));
    return out;
}

Dataset Dataset::withInputs(const std::vector<std::string>& columns) const {
    Dataset out(columns, outputNames_, stringNames_);
    out.rowIds_ = rowIds_;
    out.rowIdSet_ = rowIdSet_;
    out.outputs_ = outputs_;
    out.strings_ = strings_;
    for (size_t j = 0; j < columns.size(); ++j) out.inputs_[j] = inputColumn(columns[j]);
    out.labels_ = labels_;
    return out;
}

Dataset Dataset::transformed(const std::function<double(const std::string&, double)>& fn) const {
    Dataset out = *this;
    for (size_t j = 0; j < out.inputs_.size(); ++j) {
        for (double& v : out.inputs_[j]) v = fn(inputNames_[j], v);
    }
    for (size_t j = 0; j < out.outputs_.size(); ++j) {
        for (double& v : out.outputs_[j]) v = fn(outputNames_[j], v);
    }
    return out;
}

void Dataset::attachLabels(std::vector<PartitionLabel> labels) {
    if (labels.size() != rowCount()) {
        throw Plateau::DatasetException("got " + std::to_string(labels.size()) + " partition labels for " +
                                        std::to_string(rowCount()) + " rows");
    }
    labels_ = std::move(labels);
}

void Dataset::checkRow(size_t row) const {
    if (row >= rowIds_.size()) {
        throw Plateau::DatasetException("row index " + std::to_string(row) + " out of range (" +
                                        std::to_string(rowIds_.size()) + " rows)");
    }
}
