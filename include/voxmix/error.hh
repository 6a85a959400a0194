// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace voxmix {

/**
 * @brief Base exception class for all voxmix errors
 *
 * All voxmix-specific exceptions derive from this class, making it easy
 * to catch all voxmix errors with a single catch block.
 */
class voxmix_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Sound loading errors
 *
 * Thrown when a source cannot be turned into a sample store, such as:
 * - File not found or unreadable
 * - Corrupted or unsupported data
 * - Unsupported channel count (only mono and stereo are accepted)
 * - Zero sample rate
 *
 * No voice is created when play() fails with this error.
 */
class load_error : public voxmix_error {
public:
    using voxmix_error::voxmix_error;
};

/**
 * @brief Lookup errors
 *
 * Thrown by query_one() and music_player::get_time() when no active
 * voice carries the requested id.
 */
class not_found_error : public voxmix_error {
public:
    using voxmix_error::voxmix_error;
};

/**
 * @brief Audio device related errors
 *
 * Thrown when device operations fail, such as:
 * - Backend not initialized
 * - Device not found
 * - Device or stream could not be opened
 */
class device_error : public voxmix_error {
public:
    using voxmix_error::voxmix_error;
};

/**
 * @brief I/O stream related errors
 *
 * Thrown when a file cannot be opened for reading.
 */
class io_error : public voxmix_error {
public:
    using voxmix_error::voxmix_error;
};

} // namespace voxmix

/*
 * Copyright (C) 2025
 *
 * This file is part of voxmix.
 *
 * voxmix is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * voxmix is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with voxmix.  If not, see <http://www.gnu.org/licenses/>.
 */
