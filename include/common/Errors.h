#pragma once

#include <stdexcept>
#include <string>

namespace marketpipe {

// 파이프라인 예외 공통 베이스
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

// 모든 프로바이더 재시도 소진
class DownloadError : public PipelineError {
public:
    explicit DownloadError(const std::string& message) : PipelineError(message) {}
};

// 품질 검사 실패
class ValidationError : public PipelineError {
public:
    explicit ValidationError(const std::string& message) : PipelineError(message) {}
};

// 디스크/권한/빈 프레임 등 저장 실패
class StorageError : public PipelineError {
public:
    explicit StorageError(const std::string& message) : PipelineError(message) {}
};

// 반드시 있어야 할 아티팩트가 없음
class NotFoundError : public PipelineError {
public:
    explicit NotFoundError(const std::string& message) : PipelineError(message) {}
};

} // namespace marketpipe
