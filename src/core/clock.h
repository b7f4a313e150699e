#pragma once

// Milliseconds since an arbitrary monotonic origin. Differences are wrap-safe
// when computed as unsigned subtraction (now - earlier).
unsigned long monotonicMs();

void delayMs(unsigned long ms);
