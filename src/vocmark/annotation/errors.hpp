
#pragma once

#include <stdexcept>
#include <string>

namespace vocmark
{
// Base of everything the annotation layer throws. Front-ends catch this,
// log it, and abort the run.
struct AnnotationError : public std::runtime_error
{
   using std::runtime_error::runtime_error;
};

struct NotADirectoryError final : public AnnotationError
{
   using AnnotationError::AnnotationError;
};

struct NoImagesFoundError final : public AnnotationError
{
   using AnnotationError::AnnotationError;
};

struct AlreadyExistsError final : public AnnotationError
{
   using AnnotationError::AnnotationError;
};

struct ParseError final : public AnnotationError
{
   using AnnotationError::AnnotationError;
};

struct ImageReadError final : public AnnotationError
{
   using AnnotationError::AnnotationError;
};

} // namespace vocmark
