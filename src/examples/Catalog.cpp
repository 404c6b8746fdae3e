#include "Catalog.h"
#include "../core/Config.h"
#include "OutageSimulation.h"
#include "AbstractFactoryExample.h"
#include "BuilderExample.h"
#include "FactoryMethodExample.h"
#include "PrototypeExample.h"
#include "SingletonExample.h"
#include "AdapterExample.h"
#include "BridgeExample.h"
#include "CompositeExample.h"
#include "DecoratorExample.h"
#include "FacadeExample.h"
#include "FlyweightExample.h"
#include "ProxyExample.h"
#include "ChainOfResponsibilityExample.h"
#include "CommandExample.h"
#include "InterpreterExample.h"
#include "IteratorExample.h"
#include "MediatorExample.h"
#include "MementoExample.h"
#include "ObserverExample.h"
#include "StateExample.h"
#include "StrategyExample.h"
#include "TemplateMethodExample.h"
#include "VisitorExample.h"
#include <algorithm>

namespace pattern_harness {
namespace examples {

namespace {
    template <typename T>
    ExampleFactory make() {
        return []() -> ExamplePtr { return std::make_unique<T>(); };
    }

    using Lines = std::vector<std::string>;
}

std::vector<ExampleSpec> default_catalog(const Config& cfg) {
    const std::uint32_t seed = cfg.seed;
    std::vector<ExampleSpec> specs = {
        // Creational
        {"AbstractFactory", Category::Creational, make<AbstractFactoryExample>(),
            Lines{"windows button rendered", "windows checkbox rendered", "mac button rendered", "mac checkbox rendered"}},
        {"Builder", Category::Creational, make<BuilderExample>(),
            Lines{"burger size 14: cheese, pepperoni, lettuce", "burger size 10: tomato"}},
        {"FactoryMethod", Category::Creational, make<FactoryMethodExample>(),
            Lines{"development manager: asking about design patterns", "marketing manager: asking about community building"}},
        {"Prototype", Category::Creational, make<PrototypeExample>(),
            Lines{"original: Jolly (Mountain Sheep)", "clone: Dolly (Mountain Sheep)", "distinct objects: true"}},
        {"Singleton", Category::Creational, make<SingletonExample>(),
            Lines{"instance-1==instance-2: true"}},

        // Structural
        {"Adapter", Category::Structural, make<AdapterExample>(),
            Lines{"african lion roars", "asian lion roars", "wild dog barks (adapted)"}},
        {"Bridge", Category::Structural, make<BridgeExample>(),
            Lines{"about page in dark black", "careers page in off white", "about page in off white"}},
        {"Composite", Category::Structural, make<CompositeExample>(),
            Lines{"company 31000", "  engineering 22000", "    alice 12000", "    bob 10000", "  design 9000", "    carol 9000"}},
        {"Decorator", Category::Structural, make<DecoratorExample>(),
            Lines{"Simple coffee: 10", "Simple coffee, milk: 12", "Simple coffee, milk, whip: 17", "Simple coffee, milk, whip, vanilla: 20"}},
        {"Facade", Category::Structural, make<FacadeExample>(),
            Lines{"ouch!", "beep beep!", "loading..", "ready to be used!", "bup bup bup buzzzz!", "haaah!", "zzzzz"}},
        // color picks depend on the seed, so only determinism is checked
        {"Flyweight", Category::Structural, [seed]() -> ExamplePtr { return std::make_unique<FlyweightExample>(seed); },
            std::nullopt},
        {"Proxy", Category::Structural, make<ProxyExample>(),
            Lines{"wrong password: access denied", "lab door opened", "lab door closed"}},

        // Behavioral
        {"ChainOfResponsibility", Category::Behavioral, make<ChainOfResponsibilityExample>(),
            Lines{"bank cannot pay 259, forwarding", "paypal cannot pay 259, forwarding", "paid 259 using bitcoin",
                  "paid 50 using bank",
                  "bank cannot pay 1000, forwarding", "paypal cannot pay 1000, forwarding", "no account can pay 1000"}},
        {"Command", Category::Behavioral, make<CommandExample>(),
            Lines{"bulb has been lit", "darkness!", "bulb has been lit", "darkness!", "nothing to undo"}},
        {"Interpreter", Category::Behavioral, make<InterpreterExample>(),
            Lines{"expression: ((3 + 4) * 2)", "result: 14", "expression: ((10 + (2 * 8)) - 3)", "result: 23"}},
        {"Iterator", Category::Behavioral, make<IteratorExample>(),
            Lines{"removed: 1", "station 101.0", "station 102.0", "station 103.2", "stations: 3"}},
        {"Mediator", Category::Behavioral, make<MediatorExample>(),
            Lines{"John: Hi there!", "Jane: Hey!"}},
        {"Memento", Category::Behavioral, make<MementoExample>(),
            Lines{"before undo: This is the first sentence. This is second.", "after undo: This is the first sentence."}},
        {"Observer", Category::Behavioral, make<ObserverExample>(),
            Lines{"Hi John Doe! New job posted: Software Engineer", "Hi Jane Doe! New job posted: Software Engineer",
                  "Hi John Doe! New job posted: QA Engineer"}},
        {"State", Category::Behavioral, make<StateExample>(),
            Lines{"First line", "SECOND LINE", "THIRD LINE", "fourth line", "Fifth line"}},
        {"Strategy", Category::Behavioral, make<StrategyExample>(),
            Lines{"paid 15 with credit card", "paid 15 using PayPal"}},
        {"TemplateMethod", Category::Behavioral, make<TemplateMethodExample>(),
            Lines{"running android tests", "linting android code", "assembling android build", "deploying android build to play store",
                  "running ios tests", "linting ios code", "assembling ios build", "deploying ios build to app store"}},
        {"Visitor", Category::Behavioral, make<VisitorExample>(),
            Lines{"square area 9", "rectangle area 10", "triangle area 6",
                  "export square side=3", "export rectangle 2x5", "export triangle base=4 height=3"}},
    };

    for(auto& spec : specs) {
        if(std::find(cfg.simulate_unavailable.begin(), cfg.simulate_unavailable.end(), spec.name) != cfg.simulate_unavailable.end()) {
            spec.factory = with_outage(std::move(spec.factory));
        }
    }
    return specs;
}

}
}
