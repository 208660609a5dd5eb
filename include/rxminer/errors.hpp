#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rxminer {

class MinerError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invalid or missing configuration. Fatal at startup.
class ConfigError : public MinerError {
public:
  using MinerError::MinerError;
};

// An algorithm context could not be built (memory, seed, backend library).
class ContextInitError : public MinerError {
public:
  using MinerError::MinerError;
};

// A hashing unit hit an unexpected failure; the unit is restarted.
class WorkerFault : public MinerError {
public:
  WorkerFault(uint32_t worker_index, const std::string& what)
    : MinerError("worker " + std::to_string(worker_index) + ": " + what),
      worker_index_(worker_index) {}

  uint32_t worker_index() const { return worker_index_; }

private:
  uint32_t worker_index_;
};

// A nonce range was requested for a job that is no longer current.
class JobStaleError : public MinerError {
public:
  explicit JobStaleError(uint64_t job_id)
    : MinerError("job " + std::to_string(job_id) + " is stale"),
      job_id_(job_id) {}

  uint64_t job_id() const { return job_id_; }

private:
  uint64_t job_id_;
};

class SubmitError : public MinerError {
public:
  using MinerError::MinerError;
};

// The statistics channel was used after it was closed.
class ChannelError : public MinerError {
public:
  using MinerError::MinerError;
};

class ConnectionError : public MinerError {
public:
  using MinerError::MinerError;
};

class ProtocolError : public MinerError {
public:
  using MinerError::MinerError;
};

} // namespace rxminer
