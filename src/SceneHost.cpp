#include "SceneHost.h"

#include <exception>
#include <iostream>

const char* artifactKindName(ArtifactKind kind)
{
    switch (kind)
    {
    case ArtifactKind::Mesh:      return "mesh";
    case ArtifactKind::Placement: return "placement";
    case ArtifactKind::Volume:    return "volume";
    case ArtifactKind::Target:    return "target";
    }
    return "unknown";
}

SceneTransaction::~SceneTransaction()
{
    if (committed_)
        return;

    // Newest first, so children go before the placements they ride on.
    for (auto it = created_.rbegin(); it != created_.rend(); ++it)
    {
        try
        {
            scene_.remove(*it);
        }
        catch (const std::exception& e)
        {
            std::cerr << "[scene] rollback of artifact " << *it
                      << " raised: " << e.what() << "\n";
        }
    }
}
