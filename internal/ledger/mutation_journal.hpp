#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/reconcile/row_images.hpp"
#include "recon/report/v1/report.pb.h"

namespace recon::ledger {

/*
  MutationJournal

  Records every row a run writes, one entry per (table, key) in the
  order rows were first touched. An entry keeps the image from before
  the first write and the image after the last one, so it is both the
  backup snapshot of the run and the source of change-set samples.

  Not thread-safe; one journal per run.
*/
class MutationJournal {
 public:
  template <typename Row>
  void Inserted(const Row& after) {
    auto& image = Touch(reconcile::TableOf(after), reconcile::KeyOf(after), nullptr);
    image.set_exists_after(true);
    *image.mutable_after() = reconcile::ToStruct(after);
  }

  template <typename Row>
  void Updated(const Row& before, const Row& after) {
    const auto before_image = reconcile::ToStruct(before);
    auto&      image        = Touch(reconcile::TableOf(after), reconcile::KeyOf(after), &before_image);
    image.set_exists_after(true);
    *image.mutable_after() = reconcile::ToStruct(after);
  }

  template <typename Row>
  void Deleted(const Row& before) {
    const auto before_image = reconcile::ToStruct(before);
    auto&      image        = Touch(reconcile::TableOf(before), reconcile::KeyOf(before), &before_image);
    image.set_exists_after(false);
    image.clear_after();
  }

  const std::vector<recon::report::v1::RowImage>& Rows() const {
    return rows_;
  }

  size_t Size() const {
    return rows_.size();
  }

 private:
  recon::report::v1::RowImage& Touch(std::string_view table, const std::string& key, const google::protobuf::Struct* before);

  std::vector<recon::report::v1::RowImage> rows_;
  std::unordered_map<std::string, size_t>  index_;
};

} // namespace recon::ledger
