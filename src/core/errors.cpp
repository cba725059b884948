#include "auditchain/core/errors.hpp"

namespace auditchain::core {
  std::string_view to_string(IntegrityCheck check) {
    switch (check) {
      case IntegrityCheck::None: return "none";
      case IntegrityCheck::HashMismatch: return "hash_mismatch";
      case IntegrityCheck::InsufficientWork: return "insufficient_work";
      case IntegrityCheck::BrokenLink: return "broken_link";
      case IntegrityCheck::IndexGap: return "index_gap";
      case IntegrityCheck::CheckpointMismatch: return "checkpoint_mismatch";
      case IntegrityCheck::Unreadable: return "unreadable";
      case IntegrityCheck::IndexMismatch: return "index_mismatch";
    }
    return "unknown";
  }
}
