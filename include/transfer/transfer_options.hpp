#ifndef DOCXFER_TRANSFER_OPTIONS_HPP
#define DOCXFER_TRANSFER_OPTIONS_HPP

#include <cstddef>
#include <functional>
#include <string>
#include "store/object_store.hpp"

namespace docxfer {
namespace transfer {

struct TransferProgress {
  std::size_t documents = 0;
  std::size_t bytes = 0;
};

// Reporting hook, never affects the transfer itself
using ProgressFn = std::function<void(const TransferProgress&)>;

struct PushOptions {
  store::ObjectVisibility visibility = store::ObjectVisibility::Private;
  ProgressFn progress;
};

struct PullOptions {
  ProgressFn progress;
};

struct PushResult {
  std::size_t documents = 0;
  std::size_t bytes = 0;
  std::size_t blocks = 0;
  // Hex SHA-256 of the stored object
  std::string sha256;
};

} // namespace transfer
} // namespace docxfer

#endif // DOCXFER_TRANSFER_OPTIONS_HPP
