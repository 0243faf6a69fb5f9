#pragma once
#include <stdexcept>
#include <string>

class RoomSyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or oversized input; nothing was changed.
class ValidationError : public RoomSyncError {
public:
    using RoomSyncError::RoomSyncError;
};

class NotFoundError : public RoomSyncError {
public:
    using RoomSyncError::RoomSyncError;
};

// Built-in rooms cannot be deleted.
class PermissionError : public RoomSyncError {
public:
    using RoomSyncError::RoomSyncError;
};

// Room still has active players.
class ConflictError : public RoomSyncError {
public:
    using RoomSyncError::RoomSyncError;
};

// A storage read or write failed. The in-memory path keeps working.
class PersistenceError : public RoomSyncError {
public:
    using RoomSyncError::RoomSyncError;
};
