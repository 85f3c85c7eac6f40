#pragma once

// ============================================================================
// EtlErrors — The exception taxonomy of the execution core
// ============================================================================
//
//   EtlError (std::runtime_error)
//     ├── InvalidConfiguration  bad partition size / concurrency, nothing ran
//     ├── SchemaError           unknown column, bad type, caught at build time
//     ├── EvaluationError       one record broke a predicate or projection
//     ├── PartitionFailure      every EvaluationError of a run, reported at once
//     ├── MergeError            partial results that cannot be combined
//     ├── ExecutionCancelled    the run was cancelled before all tasks started
//     ├── SourceError           unreadable or malformed input
//     └── SinkError             Parquet / PostgreSQL load failed
//
// Everything derives from std::runtime_error, so main() can keep a single
// catch (const std::exception &) at the top of the pipeline.
// ============================================================================

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

namespace PartitionFlow
{

    class EtlError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class InvalidConfiguration : public EtlError
    {
    public:
        explicit InvalidConfiguration(const std::string &message)
            : EtlError("[CONFIG] " + message)
        {
        }
    };

    class SchemaError : public EtlError
    {
    public:
        explicit SchemaError(const std::string &message)
            : EtlError("[SCHEMA] " + message)
        {
        }
    };

    // ========================================================================
    // EvaluationError — A predicate or projection failed on one record
    // ========================================================================
    // Scoped to a single partition task. Carries enough context to find the
    // offending row again: partition index, offset inside the partition and
    // a printable form of the record as it entered the failing stage.
    // ========================================================================
    class EvaluationError : public EtlError
    {
    public:
        EvaluationError(size_t partition_index,
                        size_t record_offset,
                        std::string record_description,
                        std::string reason)
            : EtlError("[EVAL] partition " + std::to_string(partition_index) +
                       ", record " + std::to_string(record_offset) + " " +
                       record_description + ": " + reason),
              partition_index_(partition_index),
              record_offset_(record_offset),
              record_description_(std::move(record_description)),
              reason_(std::move(reason))
        {
        }

        size_t partition_index() const { return partition_index_; }
        size_t record_offset() const { return record_offset_; }
        const std::string &record_description() const { return record_description_; }
        const std::string &reason() const { return reason_; }

    private:
        size_t partition_index_;
        size_t record_offset_;
        std::string record_description_;
        std::string reason_;
    };

    // ========================================================================
    // PartitionFailure — Every failed partition of one run
    // ========================================================================
    class PartitionFailure : public EtlError
    {
    public:
        struct Entry
        {
            size_t partition_index;
            std::string message;
        };

        explicit PartitionFailure(std::vector<Entry> failures)
            : EtlError(build_message(sort_entries(failures))),
              failures_(std::move(failures))
        {
        }

        const std::vector<Entry> &failures() const { return failures_; }

        std::vector<size_t> failed_partitions() const
        {
            std::vector<size_t> indices;
            indices.reserve(failures_.size());
            for (const auto &f : failures_)
                indices.push_back(f.partition_index);
            return indices;
        }

    private:
        static std::vector<Entry> &sort_entries(std::vector<Entry> &failures)
        {
            std::sort(failures.begin(), failures.end(),
                      [](const Entry &a, const Entry &b)
                      { return a.partition_index < b.partition_index; });
            return failures;
        }

        static std::string build_message(const std::vector<Entry> &failures)
        {
            std::string msg = "[RUN] " + std::to_string(failures.size()) +
                              " partition(s) failed";
            for (const auto &f : failures)
                msg += "\n  partition " + std::to_string(f.partition_index) + ": " + f.message;
            return msg;
        }

        std::vector<Entry> failures_;
    };

    class MergeError : public EtlError
    {
    public:
        explicit MergeError(const std::string &message)
            : EtlError("[MERGE] " + message)
        {
        }
    };

    class ExecutionCancelled : public EtlError
    {
    public:
        explicit ExecutionCancelled(const std::string &message)
            : EtlError("[CANCELLED] " + message)
        {
        }
    };

    class SourceError : public EtlError
    {
    public:
        explicit SourceError(const std::string &message)
            : EtlError("[SOURCE] " + message)
        {
        }
    };

    class SinkError : public EtlError
    {
    public:
        explicit SinkError(const std::string &message)
            : EtlError("[SINK] " + message)
        {
        }
    };

} // namespace PartitionFlow
