#include <graphweave/graphweave.h>

#include <fstream>
#include <iostream>
#include <sstream>

namespace {

using namespace graphweave;

Node person(const std::string& id, const std::string& dept, const std::string& site) {
    Node node(id, id);
    node.set("dept", dept).set("site", site);
    return node;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void printFrame(const RenderFrame& frame) {
    std::cout << "iteration " << frame.iteration << " (" << phaseName(frame.phase) << "): "
              << frame.visibleNodeIds.size() << " nodes, "
              << frame.visibleMetaNodeIds.size() << " groups, "
              << frame.edges.size() << " edges\n";
}

}  // namespace

int main(int argc, char** argv) {
    EngineOptions options;
    if (argc > 1) {
        options = ConfigSerializer::engineOptionsFromJson(readFile(argv[1]));
    }

    std::vector<Node> nodes = {
        person("alice", "eng", "berlin"),
        person("bob", "eng", "berlin"),
        person("carol", "eng", "paris"),
        person("dave", "sales", "paris"),
        person("erin", "sales", "paris"),
        person("frank", "ops", "berlin"),
        person("grace", "ops", "berlin"),
        Node("external", "External"),
    };
    nodes.back().set("dept", std::vector<std::string>{"eng", "sales"});

    std::vector<Edge> edges = {
        {"e1", "alice", "bob", "reviews"},
        {"e2", "alice", "carol"},
        {"e3", "carol", "dave", "supports"},
        {"e4", "dave", "erin"},
        {"e5", "erin", "frank"},
        {"e6", "frank", "grace"},
        {"e7", "grace", "alice"},
        {"e8", "external", "dave"},
        {"e9", "bob", "nobody"},  // dropped: unknown target
    };

    LayoutEngine engine(options);
    engine.setGraph(nodes, edges);
    engine.setGroupingConfig(GroupingConfig().enable().addLayer("dept", true).addLayer("site"));

    // 1. Run to convergence with everything collapsed
    {
        int frames = 0;
        FrameLoop loop(engine, [&frames](const RenderFrame& frame) {
            if (++frames % 100 == 0) {
                printFrame(frame);
            }
        });
        loop.runUntilSettled(1000);
        printFrame(engine.frame());

        for (const auto& edge : engine.frame().edges) {
            std::cout << "  " << edge.edgeId << ": " << edge.renderSource
                      << " -> " << edge.renderTarget << "\n";
        }
    }

    // 2. Expand everything and inspect crossings
    {
        engine.expandAll();
        const RenderFrame& frame = engine.frame();
        size_t hopCount = 0;
        for (const auto& [edgeId, hops] : frame.hops) {
            hopCount += hops.size();
        }
        std::cout << "expanded: " << frame.edges.size() << " edges, "
                  << hopCount << " hop(s)\n";
    }

    // 3. Drag a node after convergence
    {
        const Point* start = engine.frame().findPosition("alice");
        if (start && engine.beginDrag("alice", *start + Point{200.0f, 0.0f})) {
            for (int i = 0; i < 30; ++i) {
                engine.tick();
            }
            engine.endDrag();
            const Point* end = engine.frame().findPosition("alice");
            std::cout << "alice dragged to (" << end->x << ", " << end->y << ")\n";
        }
    }

    std::cout << "graphweave " << versionString() << "\n";
    return 0;
}
