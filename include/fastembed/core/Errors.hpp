#pragma once
#include <stdexcept>
#include <string>

namespace fastembed {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// non-2xx status or transport failure while fetching a model archive
class DownloadError : public Error {
public:
    using Error::Error;
};

// corrupt gzip/tar stream, unsafe entry path, or a failed write while unpacking
class ExtractError : public Error {
public:
    using Error::Error;
};

class FilesystemError : public Error {
public:
    using Error::Error;
};

class EncodingError : public Error {
public:
    using Error::Error;
};

// tensors whose element count or batch dimension disagree
class ShapeError : public Error {
public:
    using Error::Error;
};

class InferenceError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace fastembed
