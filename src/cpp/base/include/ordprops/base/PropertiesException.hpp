/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace ordprops
{

//-------------------------------------------------------------------------

class PropertiesException : public std::runtime_error
{
public:
    PropertiesException(const std::string& message) : std::runtime_error(message) {}
    PropertiesException(const PropertiesException& exception) = default;
    PropertiesException(PropertiesException&& exception) = default;
};

//-------------------------------------------------------------------------
// Malformed text or XML input.

class FormatError : public PropertiesException
{
public:
    using PropertiesException::PropertiesException;
};

//-------------------------------------------------------------------------
// Transport failure on the underlying stream.

class IOError : public PropertiesException
{
public:
    using PropertiesException::PropertiesException;
};

//-------------------------------------------------------------------------
// A reconstructed snapshot that cannot yield a usable instance.

class InvalidStateError : public PropertiesException
{
public:
    using PropertiesException::PropertiesException;
};

//-------------------------------------------------------------------------

}  // namespace ordprops

//-------------------------------------------------------------------------
