/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionBackend.h"

namespace Synk
{

SessionBackend::SessionBackend(QObject *parent)
    : QObject(parent)
{
}

SessionBackend::~SessionBackend() = default;

} // namespace Synk

#include "moc_SessionBackend.cpp"
