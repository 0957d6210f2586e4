// Repository: Segcast-recorder
// Component: gRPC Chunk Uploader
// Purpose: Streams segment files to the ChunkIngestService over gRPC.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_UPLOAD_GRPC_CHUNK_UPLOADER_HPP_
#define SEGCAST_UPLOAD_GRPC_CHUNK_UPLOADER_HPP_

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "chunk_ingest.grpc.pb.h"

#include "segcast/upload/IChunkUploader.hpp"

namespace segcast::upload {

// One client-streaming UploadChunk call per file:
//   1. ChunkMetadata (ids, destination, kind, file name, size)
//   2. file bytes in `chunk_bytes` pieces
//   3. WritesDone + Finish; the server's `accepted` decides success
// Each call carries a deadline of `timeout`. No retries.
//
// The stub is shared; concurrent Upload() calls each use their own context.
class GrpcChunkUploader : public IChunkUploader {
 public:
  GrpcChunkUploader(const std::string& target_address, std::chrono::milliseconds timeout,
                    size_t chunk_bytes);

  // For tests: use an existing channel (e.g. in-process server).
  GrpcChunkUploader(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds timeout,
                    size_t chunk_bytes);

  UploadResult Upload(const std::optional<RecordingOptions>& options,
                      const std::string& file_path, UploadKind kind) override;

 private:
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<segcast::ingest::v1::ChunkIngestService::Stub> stub_;
  const std::chrono::milliseconds timeout_;
  const size_t chunk_bytes_;
};

}  // namespace segcast::upload

#endif  // SEGCAST_UPLOAD_GRPC_CHUNK_UPLOADER_HPP_
