#pragma once
namespace gtfsnav::gtfs
{
// Tri-state used by wheelchair_boarding, wheelchair_accessible and bikes_allowed.
enum class accessibility
{
    NoInfo = 0,
    Available = 1,
    NotAvailable = 2
};
}
