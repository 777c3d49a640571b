#pragma once

#include <stdexcept>
#include <string>

// Parametres invalides, rejetes avant toute simulation
class ValidationError : public std::runtime_error
{
public:
    explicit ValidationError(const std::string &what) : std::runtime_error(what) {}
};

// Moins de deux tirages : la variance empirique n'est pas definie
class DegenerateSampleError : public std::runtime_error
{
public:
    explicit DegenerateSampleError(const std::string &what) : std::runtime_error(what) {}
};

// Valeur non finie (ou trajectoire non positive) produite par la simulation
class NumericOverflowError : public std::runtime_error
{
public:
    explicit NumericOverflowError(const std::string &what) : std::runtime_error(what) {}
};
