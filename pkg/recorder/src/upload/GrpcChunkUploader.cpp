// Repository: Segcast-recorder
// Component: gRPC Chunk Uploader
// Purpose: Streams segment files to the ChunkIngestService over gRPC.
// Copyright (c) 2025 Segcast

#include "segcast/upload/GrpcChunkUploader.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

#include "segcast/util/Logger.hpp"

namespace segcast::upload {

namespace proto = segcast::ingest::v1;

namespace {

proto::StreamKind ToProto(UploadKind kind) {
  switch (kind) {
    case UploadKind::kAudio:
      return proto::STREAM_KIND_AUDIO;
    case UploadKind::kVideo:
      return proto::STREAM_KIND_VIDEO;
    case UploadKind::kScreenshot:
      return proto::STREAM_KIND_SCREENSHOT;
  }
  return proto::STREAM_KIND_UNSPECIFIED;
}

}  // namespace

GrpcChunkUploader::GrpcChunkUploader(const std::string& target_address,
                                     std::chrono::milliseconds timeout, size_t chunk_bytes)
    : GrpcChunkUploader(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials()),
                        timeout, chunk_bytes) {}

GrpcChunkUploader::GrpcChunkUploader(std::shared_ptr<grpc::Channel> channel,
                                     std::chrono::milliseconds timeout, size_t chunk_bytes)
    : channel_(std::move(channel)),
      stub_(proto::ChunkIngestService::NewStub(channel_)),
      timeout_(timeout),
      chunk_bytes_(chunk_bytes == 0 ? 64 * 1024 : chunk_bytes) {}

UploadResult GrpcChunkUploader::Upload(const std::optional<RecordingOptions>& options,
                                       const std::string& file_path, UploadKind kind) {
  if (!options) {
    return UploadResult::Failure("no recording options for " + file_path);
  }

  std::error_code ec;
  const auto size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    return UploadResult::Failure("stat " + file_path + ": " + ec.message());
  }
  std::ifstream in(file_path, std::ios::binary);
  if (!in) {
    return UploadResult::Failure("open " + file_path + " failed");
  }

  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout_);
  proto::ChunkUploadResponse response;
  auto stream = stub_->UploadChunk(&context, &response);

  proto::ChunkUploadRequest first;
  auto* meta = first.mutable_metadata();
  meta->set_user_id(options->user_id);
  meta->set_video_id(options->video_id);
  meta->set_bucket(options->bucket);
  meta->set_region(options->region);
  meta->set_kind(ToProto(kind));
  meta->set_file_name(std::filesystem::path(file_path).filename().string());
  meta->set_size_bytes(static_cast<uint64_t>(size));

  bool write_ok = stream->Write(first);
  std::vector<char> buf(chunk_bytes_);
  while (write_ok && in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    std::streamsize got = in.gcount();
    if (got <= 0) break;
    proto::ChunkUploadRequest piece;
    piece.set_data(buf.data(), static_cast<size_t>(got));
    write_ok = stream->Write(piece);
  }
  if (in.bad()) {
    context.TryCancel();
    grpc::Status cancelled = stream->Finish();
    return UploadResult::Failure("read " + file_path + " failed, call ended: " +
                                 cancelled.error_message());
  }

  stream->WritesDone();
  grpc::Status status = stream->Finish();
  if (!status.ok()) {
    return UploadResult::Failure(std::string(UploadKindName(kind)) + " upload of " + file_path +
                                 " failed: " + status.error_message());
  }
  if (!write_ok) {
    return UploadResult::Failure("stream closed early while sending " + file_path);
  }
  if (!response.accepted()) {
    return UploadResult::Failure("rejected " + file_path + ": " + response.message());
  }
  util::Logger::Debug("[ChunkUploader] sent " + file_path + " kind=" + UploadKindName(kind) +
                      " bytes=" + std::to_string(response.bytes_received()));
  return UploadResult::Success();
}

}  // namespace segcast::upload
