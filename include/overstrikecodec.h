#pragma once

#include "documentbuffer.h"

#include <QByteArray>

// Plain-text persistence of bold/underline using typewriter overstrikes:
//   bold            c BS c
//   underline       c BS _
//   bold+underline  c BS c BS _
// For '_' itself the overstrike count decides: 1 bold, 2 underline, 3 both.
namespace OverstrikeCodec {

constexpr char16_t Backspace = u'\b';

QByteArray encode(const DocumentBuffer &document);
DocumentBuffer decode(const QByteArray &bytes);

} // namespace OverstrikeCodec
