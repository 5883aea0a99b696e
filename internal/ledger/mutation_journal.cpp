#include "mutation_journal.hpp"

namespace recon::ledger {

recon::report::v1::RowImage& MutationJournal::Touch(std::string_view table, const std::string& key, const google::protobuf::Struct* before) {
  std::string index_key(table);
  index_key.push_back('/');
  index_key.append(key);

  auto it = index_.find(index_key);
  if (it != index_.end()) {
    return rows_[it->second];
  }

  auto& image = rows_.emplace_back();
  image.set_table(std::string(table));
  image.set_key(key);
  image.set_existed_before(before != nullptr);
  if (before) {
    *image.mutable_before() = *before;
  }

  index_.emplace(std::move(index_key), rows_.size() - 1);
  return image;
}

} // namespace recon::ledger
