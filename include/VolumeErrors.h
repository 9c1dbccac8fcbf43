#pragma once

#include <stdexcept>
#include <string>

/// Base class for failures while turning raw bytes into a Volume.
class VolumeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Bad magic, truncated buffer, or a header layout we cannot interpret.
/// The whole load is aborted; no partial volume is returned.
class MalformedInputError : public VolumeError
{
public:
    using VolumeError::VolumeError;
};

/// A gzip stream that could not be inflated to completion.
class DecompressionError : public VolumeError
{
public:
    using VolumeError::VolumeError;
};
