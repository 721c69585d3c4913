// Repository: Montage-preview
// Component: Export Delegate Interface
// Purpose: Receives the outcome of the preview screen.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_EXPORTING_IEXPORT_DELEGATE_H_
#define MONTAGE_EXPORTING_IEXPORT_DELEGATE_H_

#include <cstdint>
#include <optional>
#include <string>

namespace montage::exporting {

// All callbacks are delivered on the owner executor.
// std::nullopt means "no result" (export cancelled after a merge failure).
class IExportDelegate {
 public:
  virtual ~IExportDelegate() = default;

  virtual void OnVideoExported(const std::optional<std::string>& video_ref) = 0;
  virtual void OnImageExported(const std::optional<std::string>& image_ref) = 0;
  virtual void OnDismissed() = 0;
};

// Optional UI hook for the loading indication and the retry/cancel prompt.
class IExportProgressObserver {
 public:
  virtual ~IExportProgressObserver() = default;

  virtual void OnLoadingChanged(bool visible) = 0;

  // A merge attempt failed; the caller should offer Retry() or Cancel().
  // Loading stays visible until one of them is chosen.
  virtual void OnRetryableFailure(uint32_t attempt) = 0;
};

}  // namespace montage::exporting

#endif  // MONTAGE_EXPORTING_IEXPORT_DELEGATE_H_
