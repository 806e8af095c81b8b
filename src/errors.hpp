#pragma once

#include <stdexcept>
#include <string>

// Every failure in a session is fatal; these only tell the operator which kind.
class BlocksyncError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class VersionMismatch : public BlocksyncError {
public:
  using BlocksyncError::BlocksyncError;
};

class ChainIntegrityError : public BlocksyncError {
public:
  using BlocksyncError::BlocksyncError;
};

class RecordParsingError : public BlocksyncError {
public:
  using BlocksyncError::BlocksyncError;
};

// A channel returned fewer bytes than required or the peer went away.
class PeerDied : public BlocksyncError {
public:
  using BlocksyncError::BlocksyncError;
};

class ProtocolError : public BlocksyncError {
public:
  using BlocksyncError::BlocksyncError;
};

class IoError : public BlocksyncError {
public:
  using BlocksyncError::BlocksyncError;
};
