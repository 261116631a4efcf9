#include "ComponentCollection.hpp"
#include <algorithm>
#include "MultiLogger.hpp"





ComponentCollection::ComponentCollection():
	mIsStarted(false)
{
}





ComponentCollection::~ComponentCollection()
{
	try
	{
		stop();
	}
	catch (const std::exception & exc)
	{
		qWarning() << "Failed to stop the components:" << exc.what();
	}
}





void ComponentCollection::start()
{
	if (mIsStarted)
	{
		throw LogicError("The components have already been started");
	}
	mIsStarted = true;
	for (const auto & component: componentsInStartOrder())
	{
		component->start();
		mStarted.push_back(component);
	}
}





void ComponentCollection::stop()
{
	while (!mStarted.empty())
	{
		auto component = mStarted.back();
		mStarted.pop_back();
		component->stop();
	}
}





Logger & ComponentCollection::logger(const QString & aName)
{
	return get<MultiLogger>()->logger(aName);
}





QString ComponentCollection::kindName(ComponentCollection::ComponentKind aKind)
{
	switch (aKind)
	{
		case ckInstallConfiguration: return QString::fromUtf8("InstallConfiguration");
		case ckMultiLogger:          return QString::fromUtf8("MultiLogger");
		case ckDatabase:             return QString::fromUtf8("Database");
		case ckCookieCache:          return QString::fromUtf8("CookieCache");
	}
	return QString("<unknown component %1>").arg(static_cast<int>(aKind));
}





void ComponentCollection::addComponent(
	ComponentCollection::ComponentKind aKind,
	ComponentCollection::ComponentBasePtr aComponent
)
{
	if (aComponent == nullptr)
	{
		throw LogicError("Cannot add an empty %1 component", kindName(aKind));
	}
	if (!mComponents.insert({aKind, aComponent}).second)
	{
		throw LogicError("The %1 component is already present", kindName(aKind));
	}
}





ComponentCollection::ComponentBasePtr ComponentCollection::get(ComponentCollection::ComponentKind aKind)
{
	auto itr = mComponents.find(aKind);
	if (itr == mComponents.end())
	{
		throw LogicError("The %1 component is not present", kindName(aKind));
	}
	return itr->second;
}





void ComponentCollection::requireForStart(
	ComponentCollection::ComponentKind aThisComponent,
	ComponentCollection::ComponentKind aRequiredComponent
)
{
	if (mIsStarted)
	{
		throw LogicError("Cannot add start requirements to already started components");
	}
	if (aThisComponent == aRequiredComponent)
	{
		throw LogicError("The %1 component cannot require itself", kindName(aThisComponent));
	}
	mStartRequirements[aThisComponent].push_back(aRequiredComponent);
}





std::vector<ComponentCollection::ComponentBasePtr> ComponentCollection::componentsInStartOrder()
{
	std::vector<ComponentKind> order, visiting;
	for (const auto & component: mComponents)
	{
		appendInStartOrder(component.first, visiting, order);
	}
	std::vector<ComponentBasePtr> res;
	for (const auto kind: order)
	{
		res.push_back(mComponents[kind]);
	}
	return res;
}





void ComponentCollection::appendInStartOrder(
	ComponentCollection::ComponentKind aKind,
	std::vector<ComponentCollection::ComponentKind> & aVisiting,
	std::vector<ComponentCollection::ComponentKind> & aOrder
)
{
	if (std::find(aOrder.begin(), aOrder.end(), aKind) != aOrder.end())
	{
		return;
	}
	if (std::find(aVisiting.begin(), aVisiting.end(), aKind) != aVisiting.end())
	{
		throw LogicError("The components' start requirements are cyclic, involving %1", kindName(aKind));
	}
	aVisiting.push_back(aKind);
	for (const auto required: mStartRequirements[aKind])
	{
		if (mComponents.find(required) == mComponents.end())
		{
			throw LogicError("The %1 component requires %2, which is not present", kindName(aKind), kindName(required));
		}
		appendInStartOrder(required, aVisiting, aOrder);
	}
	aVisiting.pop_back();
	aOrder.push_back(aKind);
}
