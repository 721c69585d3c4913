// Stub asset merge service.  Records every request and completes only when
// the test says so.

#ifndef MONTAGE_TESTS_FIXTURES_STUB_MERGE_SERVICE_H_
#define MONTAGE_TESTS_FIXTURES_STUB_MERGE_SERVICE_H_

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "montage/exporting/IAssetMergeService.h"
#include "montage/model/Segment.h"

namespace montage::tests::fixtures {

class StubMergeService : public montage::exporting::IAssetMergeService {
 public:
  void Merge(const montage::model::SegmentList& segments,
             MergeCompletion completion) override {
    requests_.push_back(segments);
    completions_.push_back(std::move(completion));
  }

  // Completes request `index` (default: the latest).  std::nullopt or an
  // empty string is a failure.
  void Complete(std::optional<std::string> result, std::size_t index) {
    MergeCompletion completion = std::move(completions_.at(index));
    completions_.at(index) = nullptr;
    if (completion) completion(std::move(result));
  }
  void CompleteLatest(std::optional<std::string> result) {
    Complete(std::move(result), completions_.size() - 1);
  }

  std::size_t call_count() const { return requests_.size(); }
  const std::vector<montage::model::SegmentList>& requests() const { return requests_; }

 private:
  std::vector<montage::model::SegmentList> requests_;
  std::vector<MergeCompletion> completions_;
};

}  // namespace montage::tests::fixtures

#endif  // MONTAGE_TESTS_FIXTURES_STUB_MERGE_SERVICE_H_
