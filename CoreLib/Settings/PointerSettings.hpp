#pragma once

#include <string>

struct PointerSettings
{
    // --------------------------------------------------------
    // Tap gesture
    // --------------------------------------------------------
    float  tapDistanceThreshold     = 10.0f; // max travel in client pixels before a tap is voided
    double tapGestureMaxDurationMs  = 300.0; // press-to-release limit for a tap to become a click
    double tapDblClickMaxDurationMs = 300.0; // start-to-start limit between two taps for a dblclick

    // --------------------------------------------------------
    // Picking
    // --------------------------------------------------------
    std::string meshIntersector = "Embree"; // factory name used by PointerWorld::createMeshIntersector()

    // --------------------------------------------------------
    // Debug
    // --------------------------------------------------------
    bool collectStats = false; // report PointerStats after every pick
};
